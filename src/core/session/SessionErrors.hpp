#pragma once

#include <stdexcept>
#include <string>

#include "SessionTypes.hpp"

namespace termroute {

// Base for every lifecycle failure the registry reports
class SessionError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The id was never created by the registry, or has already been removed.
 */
class UnknownSessionError : public SessionError {
   public:
    explicit UnknownSessionError(const std::string& session_id)
        : SessionError("Unknown session: " + session_id), session_id_(session_id) {}

    const std::string& session_id() const noexcept { return session_id_; }

   private:
    std::string session_id_;
};

/**
 * @brief Requested lifecycle change is not an edge of the state graph.
 */
class InvalidTransitionError : public SessionError {
   public:
    InvalidTransitionError(const std::string& session_id, SessionState from, SessionState to)
        : SessionError("Invalid transition for session " + session_id + ": " + to_string(from) +
                       " -> " + to_string(to)),
          from_(from),
          to_(to) {}

    SessionState from() const noexcept { return from_; }
    SessionState to() const noexcept { return to_; }

   private:
    SessionState from_;
    SessionState to_;
};

}  // namespace termroute
