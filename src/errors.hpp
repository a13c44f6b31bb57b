#pragma once
#include <stdexcept>
#include <string>

namespace agentlink {

// Caller-visible rejection of an operation. Session state is left unchanged.
class ProtocolViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SwitchDenied : public ProtocolViolation {
public:
    explicit SwitchDenied(const std::string& session_id)
        : ProtocolViolation("session " + session_id + " does not allow switching") {}
};

class TerminateDenied : public ProtocolViolation {
public:
    explicit TerminateDenied(const std::string& session_id)
        : ProtocolViolation("session " + session_id + " cannot be ended early") {}
};

class AlreadyResolved : public ProtocolViolation {
public:
    explicit AlreadyResolved(const std::string& action_id)
        : ProtocolViolation("action " + action_id + " was already resolved") {}
};

class UnknownAction : public ProtocolViolation {
public:
    explicit UnknownAction(const std::string& action_id)
        : ProtocolViolation("no pending action " + action_id) {}
};

class DuplicateSuspension : public ProtocolViolation {
public:
    explicit DuplicateSuspension(const std::string& pending_id)
        : ProtocolViolation("action " + pending_id + " is still pending") {}
};

class FreeTextDenied : public ProtocolViolation {
public:
    explicit FreeTextDenied(const std::string& session_id)
        : ProtocolViolation("free text is not accepted by session " + session_id) {}
};

class SessionNotFound : public ProtocolViolation {
public:
    explicit SessionNotFound(const std::string& session_id)
        : ProtocolViolation("unknown session " + session_id) {}
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// connect() to a new target while a connection is still live
class ConnectionBusy : public TransportError {
public:
    using TransportError::TransportError;
};

class AuthError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RateLimited : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace agentlink
