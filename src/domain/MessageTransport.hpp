/**
 * @file MessageTransport.hpp
 * @brief Port for delivering outbound messages to a connected client.
 */

#pragma once

#include <string>
#include "domain/Messages.hpp"

namespace campaignflow::domain {

class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    /**
     * @brief Queues a message for the client.
     * @return false when the client is not connected; the message is dropped.
     */
    virtual bool send(const std::string& clientId, const OutboundMessage& message) = 0;
};

} // namespace campaignflow::domain
