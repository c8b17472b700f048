/**
 * @file WorkflowErrors.hpp
 * @brief Exceptions raised by the session engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace campaignflow::domain {

class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string& what) : std::runtime_error(what) {}
};

class SessionNotFoundError : public WorkflowError {
public:
    explicit SessionNotFoundError(const std::string& sessionId)
        : WorkflowError("no active session '" + sessionId + "'") {}
};

class SessionExistsError : public WorkflowError {
public:
    explicit SessionExistsError(const std::string& sessionId)
        : WorkflowError("session '" + sessionId + "' is already active") {}
};

/** @brief A schema or engine invariant was broken. Fatal for the session. */
class InvariantViolationError : public WorkflowError {
public:
    explicit InvariantViolationError(const std::string& what)
        : WorkflowError("invariant violation: " + what) {}
};

/** @brief Raised inside the session task when the session was cancelled while waiting. */
class SessionCancelledError : public WorkflowError {
public:
    explicit SessionCancelledError(const std::string& sessionId)
        : WorkflowError("session '" + sessionId + "' was cancelled") {}
};

} // namespace campaignflow::domain
