/**
 * @file SseTransport.cpp
 * @brief Implementation of SseTransport.
 */

#include "infrastructure/SseTransport.hpp"
#include <iostream>
#include <vector>

namespace campaignflow::infrastructure {

using json = nlohmann::json;

SseTransport::SseTransport(int workerThreads) {
    // Every open stream holds one worker for its lifetime.
    const std::size_t threads = workerThreads > 0 ? static_cast<std::size_t>(workerThreads) : 8;
    m_server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    registerRoutes();
}

SseTransport::~SseTransport() {
    stop();
}

std::string SseTransport::Frame(const json& payload) {
    return "data: " + payload.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

bool SseTransport::send(const std::string& clientId, const domain::OutboundMessage& message) {
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(clientId);
        if (it == m_channels.end()) {
            return false;
        }
        channel = it->second;
    }

    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->closed) return false;
        channel->frames.push_back(Frame(message.toJson()));
    }
    channel->cv.notify_one();
    return true;
}

void SseTransport::dispatchInbound(const std::string& clientId, const std::string& body) {
    std::shared_ptr<Inbox> inbox;
    std::uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& slot = m_inboxes[clientId];
        if (!slot) slot = std::make_shared<Inbox>();
        inbox = slot;
        std::lock_guard<std::mutex> inboxLock(inbox->mutex);
        ticket = inbox->nextTicket++;
    }

    {
        std::unique_lock<std::mutex> lock(inbox->mutex);
        inbox->cv.wait(lock, [&inbox, ticket] { return inbox->serving == ticket; });
    }

    // Hands the turn to the next message even if the callback throws.
    struct Turn {
        std::shared_ptr<Inbox> inbox;
        ~Turn() {
            {
                std::lock_guard<std::mutex> lock(inbox->mutex);
                inbox->serving++;
            }
            inbox->cv.notify_all();
        }
    } turn{inbox};

    if (m_onMessage) {
        m_onMessage(clientId, body);
    }
}

bool SseTransport::isConnected(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.count(clientId) > 0;
}

std::size_t SseTransport::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.size();
}

bool SseTransport::bind(const std::string& host, int port) {
    if (!m_server.bind_to_port(host, port)) {
        std::cerr << "[SseTransport] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    std::cout << "[SseTransport] Listening on " << host << ":" << port << std::endl;
    return true;
}

bool SseTransport::listen() {
    return m_server.listen_after_bind();
}

void SseTransport::stop() {
    std::vector<std::shared_ptr<Channel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_channels) {
            channels.push_back(entry.second);
        }
    }
    for (auto& channel : channels) {
        close(channel);
    }
    if (m_server.is_running()) {
        m_server.stop();
    }
}

void SseTransport::close(const std::shared_ptr<Channel>& channel) {
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->closed = true;
    }
    channel->cv.notify_all();
}

void SseTransport::registerRoutes() {
    m_server.Get(R"(/sessions/([^/]+)/stream)", [this](const httplib::Request& req, httplib::Response& res) {
        openStream(req.matches[1], res);
    });

    // The 202 is sent once the message has been handled. A client that needs ordering
    // between its own messages waits for it before posting the next one.
    m_server.Post(R"(/sessions/([^/]+)/messages)", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string clientId = req.matches[1];
        if (!isConnected(clientId)) {
            res.status = 404;
            res.set_content(json{{"error", "client not connected"}}.dump(), "application/json");
            return;
        }
        dispatchInbound(clientId, req.body);
        res.status = 202;
        res.set_content(json{{"status", "accepted"}}.dump(), "application/json");
    });

    m_server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json body = m_health ? m_health() : json::object();
        body["status"] = "ok";
        body["connections"] = connectionCount();
        res.set_content(body.dump(), "application/json");
    });
}

void SseTransport::openStream(const std::string& clientId, httplib::Response& res) {
    auto channel = std::make_shared<Channel>();
    std::shared_ptr<Channel> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& slot = m_channels[clientId];
        previous = slot;
        slot = channel;
    }
    if (previous) {
        std::cout << "[SseTransport] " << clientId << " reopened its stream, closing the old one" << std::endl;
        close(previous);
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [channel](std::size_t, httplib::DataSink& sink) {
            std::deque<std::string> frames;
            {
                std::unique_lock<std::mutex> lock(channel->mutex);
                channel->cv.wait_for(lock, kHeartbeatInterval,
                    [&channel] { return channel->closed || !channel->frames.empty(); });
                frames.swap(channel->frames);
                if (channel->closed && frames.empty()) {
                    lock.unlock();
                    sink.done();
                    return true;
                }
            }
            if (frames.empty()) {
                static const std::string ping = ": ping\n\n";
                return sink.write(ping.data(), ping.size());
            }
            for (const auto& frame : frames) {
                if (!sink.write(frame.data(), frame.size())) {
                    return false;
                }
            }
            return true;
        },
        [this, clientId, channel](bool) {
            bool current = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_channels.find(clientId);
                if (it != m_channels.end() && it->second == channel) {
                    m_channels.erase(it);
                    current = true;
                    auto inbox = m_inboxes.find(clientId);
                    if (inbox != m_inboxes.end()) {
                        std::lock_guard<std::mutex> inboxLock(inbox->second->mutex);
                        if (inbox->second->serving == inbox->second->nextTicket) {
                            m_inboxes.erase(inbox);
                        }
                    }
                }
            }
            close(channel);
            // A replaced stream must not tear down the session of its successor.
            if (current && m_onDisconnect) {
                m_onDisconnect(clientId);
            }
        });

    if (m_onConnect) {
        m_onConnect(clientId);
    }
}

} // namespace campaignflow::infrastructure
