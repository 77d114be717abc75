#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace termroute {

enum class AuthType {
    Password,
    Key,
};

const char* to_string(AuthType type);

/**
 * @brief Remote-shell target as handed to the transport collaborator.
 * Credential fields are opaque to the core and never serialized by it.
 */
struct ConnectionProfile {
    std::string id;
    std::string name;
    std::string host;
    int port = 22;  // NOLINT
    std::string username;
    AuthType auth_type = AuthType::Password;

    std::optional<std::string> password;
    std::optional<std::string> private_key;
    std::optional<std::string> passphrase;

    // "user@host:port", or "user@host" on the default port
    std::string connection_string() const;
};

/**
 * @brief Pure validation performed before any connection attempt.
 * @return std::nullopt when valid, otherwise a human-readable reason.
 */
std::optional<std::string> validate_profile(const ConnectionProfile& profile);

// PEM-style container check: a BEGIN marker and a PRIVATE KEY label
bool looks_like_private_key(const std::string& blob);

enum class TransportErrorKind {
    Auth,
    Config,
    Network,
};

const char* to_string(TransportErrorKind kind);

/**
 * @brief Typed failure reported by the transport collaborator.
 * The core never looks past the kind and message.
 */
class TransportError : public std::runtime_error {
   public:
    TransportError(TransportErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    TransportErrorKind kind() const noexcept { return kind_; }

   private:
    TransportErrorKind kind_;
};

}  // namespace termroute
