#include "Logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace termroute {

void SetupLogging(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);

    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    // B. Rotating File Sink
    if (!config.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.max_file_size, config.max_files);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Logger
    spdlog::drop("termroute");
    auto logger = std::make_shared<spdlog::logger>("termroute", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

}  // namespace termroute
