#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace termroute {

static constexpr std::size_t DEFAULT_RECENT_COMMANDS = 50;
static constexpr std::size_t DEFAULT_EVENT_QUEUE_CAPACITY = 256;
static constexpr std::size_t DEFAULT_LOG_FILE_SIZE = 1024UZ * 1024UZ * 5UZ;
static constexpr std::size_t DEFAULT_LOG_FILES = 3;

struct RegistryConfig {
    std::size_t recent_command_capacity = DEFAULT_RECENT_COMMANDS;
    bool auto_focus = true;
};

struct EventsConfig {
    std::size_t queue_capacity = DEFAULT_EVENT_QUEUE_CAPACITY;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/termroute.log";
    std::size_t max_file_size = DEFAULT_LOG_FILE_SIZE;
    std::size_t max_files = DEFAULT_LOG_FILES;
};

struct AppConfig {
    RegistryConfig registry;
    EventsConfig events;
    LoggingConfig logging;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "termroute.toml")
 * @return Parsed AppConfig object. Missing file yields defaults.
 * @throws std::runtime_error if the file exists but cannot be parsed.
 */
AppConfig LoadConfig(const std::string& path = "termroute.toml");

/**
 * @brief Same as LoadConfig but from an in-memory TOML document.
 * @throws std::runtime_error on parse errors.
 */
AppConfig ParseConfig(std::string_view toml_text);

}  // namespace termroute
