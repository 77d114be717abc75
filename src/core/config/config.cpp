#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace termroute {

namespace {

AppConfig FromTable(const toml::table& tbl) {
    AppConfig config;

    // 1. Registry Settings
    if (auto registry = tbl["registry"]) {
        config.registry.recent_command_capacity =
            registry["recent_command_capacity"].value_or(DEFAULT_RECENT_COMMANDS);
        if (config.registry.recent_command_capacity == 0) {
            spdlog::warn("registry.recent_command_capacity must be > 0, using {}",
                         DEFAULT_RECENT_COMMANDS);
            config.registry.recent_command_capacity = DEFAULT_RECENT_COMMANDS;
        }
    }

    // 2. Focus Settings
    if (auto focus = tbl["focus"]) {
        config.registry.auto_focus = focus["auto_focus"].value_or(true);
    }

    // 3. Event Channel Settings
    if (auto events = tbl["events"]) {
        config.events.queue_capacity =
            events["queue_capacity"].value_or(DEFAULT_EVENT_QUEUE_CAPACITY);
        if (config.events.queue_capacity == 0) {
            spdlog::warn("events.queue_capacity must be > 0, using {}",
                         DEFAULT_EVENT_QUEUE_CAPACITY);
            config.events.queue_capacity = DEFAULT_EVENT_QUEUE_CAPACITY;
        }
    }

    // 4. Logging Settings
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or("info");
        config.logging.file = logging["file"].value_or("logs/termroute.log");
        config.logging.max_file_size =
            logging["max_file_size"].value_or(DEFAULT_LOG_FILE_SIZE);
        config.logging.max_files = logging["max_files"].value_or(DEFAULT_LOG_FILES);
    }

    return config;
}

}  // namespace

AppConfig LoadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return AppConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error");
    }

    AppConfig config = FromTable(tbl);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}

AppConfig ParseConfig(std::string_view toml_text) {
    try {
        return FromTable(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config: {}", err.description());
        throw std::runtime_error("Config parse error");
    }
}

}  // namespace termroute
