#include "ConnectionProfile.hpp"

namespace termroute {

const char* to_string(AuthType type) {
    switch (type) {
        case AuthType::Password:
            return "password";
        case AuthType::Key:
            return "key";
    }
    return "unknown";
}

const char* to_string(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::Auth:
            return "auth";
        case TransportErrorKind::Config:
            return "config";
        case TransportErrorKind::Network:
            return "network";
    }
    return "unknown";
}

std::string ConnectionProfile::connection_string() const {
    std::string out = username + "@" + host;
    if (port != 22) {  // NOLINT
        out += ":" + std::to_string(port);
    }
    return out;
}

bool looks_like_private_key(const std::string& blob) {
    return blob.find("BEGIN") != std::string::npos &&
           blob.find("PRIVATE KEY") != std::string::npos;
}

std::optional<std::string> validate_profile(const ConnectionProfile& profile) {
    switch (profile.auth_type) {
        case AuthType::Password:
            if (!profile.password || profile.password->empty()) {
                return "Password is required for password authentication";
            }
            break;

        case AuthType::Key:
            if (!profile.private_key || profile.private_key->empty()) {
                return "Private key is required for key authentication";
            }
            if (!looks_like_private_key(*profile.private_key)) {
                return "Invalid private key format";
            }
            break;
    }

    if (profile.username.empty()) {
        return "Username is required";
    }
    if (profile.host.empty()) {
        return "Host is required";
    }
    if (profile.port < 1 || profile.port > 65535) {  // NOLINT
        return "Port must be between 1 and 65535";
    }

    return std::nullopt;
}

}  // namespace termroute
