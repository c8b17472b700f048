/**
 * @file SseTransport.hpp
 * @brief HTTP transport: one Server-Sent-Events stream per client plus a POST inbox.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "domain/MessageTransport.hpp"

namespace campaignflow::infrastructure {

/**
 * @class SseTransport
 * @brief Routes:
 *   - GET  /sessions/{client_id}/stream    persistent event stream (connect/disconnect)
 *   - POST /sessions/{client_id}/messages  one inbound JSON message, 202 on acceptance
 *   - GET  /health
 *
 * Outbound messages are queued per client and written in order by the stream's worker.
 * Inbound messages of one client are handed to the message callback one at a time, in
 * arrival order. A client opening a second stream replaces the first.
 */
class SseTransport : public domain::MessageTransport {
public:
    using ClientCallback = std::function<void(const std::string& clientId)>;
    using MessageCallback = std::function<void(const std::string& clientId, const std::string& body)>;
    using HealthProvider = std::function<nlohmann::json()>;

    static constexpr std::chrono::seconds kHeartbeatInterval{15};

    explicit SseTransport(int workerThreads = 64);
    ~SseTransport() override;

    void setOnConnect(ClientCallback callback) { m_onConnect = std::move(callback); }
    void setOnDisconnect(ClientCallback callback) { m_onDisconnect = std::move(callback); }
    void setOnMessage(MessageCallback callback) { m_onMessage = std::move(callback); }
    void setHealthProvider(HealthProvider provider) { m_health = std::move(provider); }

    /** @see domain::MessageTransport::send */
    bool send(const std::string& clientId, const domain::OutboundMessage& message) override;

    /**
     * @brief Runs the message callback for one inbound body.
     *
     * Calls for the same client never overlap and run in the order they got here.
     * Calls for different clients run in parallel.
     */
    void dispatchInbound(const std::string& clientId, const std::string& body);

    bool isConnected(const std::string& clientId) const;
    std::size_t connectionCount() const;

    /** @brief Binds the listening socket. Callbacks must be set before. */
    bool bind(const std::string& host, int port);

    /** @brief Serves until stop(). Blocks the calling thread. */
    bool listen();

    /** @brief Closes every stream and stops the server. */
    void stop();

    /** @brief Formats one SSE frame. */
    static std::string Frame(const nlohmann::json& payload);

private:
    struct Channel {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> frames;
        bool closed = false;
    };

    struct Inbox {
        std::mutex mutex;
        std::condition_variable cv;
        std::uint64_t nextTicket = 0;
        std::uint64_t serving = 0;
    };

    void registerRoutes();
    void openStream(const std::string& clientId, httplib::Response& res);
    static void close(const std::shared_ptr<Channel>& channel);

    httplib::Server m_server;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Channel>> m_channels;
    std::map<std::string, std::shared_ptr<Inbox>> m_inboxes;

    ClientCallback m_onConnect;
    ClientCallback m_onDisconnect;
    MessageCallback m_onMessage;
    HealthProvider m_health;
};

} // namespace campaignflow::infrastructure
