#pragma once

#include <cstddef>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "FocusEvent.hpp"

namespace termroute {

enum class ProcessType {
    Oneshot,      // ls, echo: runs and completes
    Interactive,  // editors, pagers, top
    Persistent,
    Watcher,      // tail -f, nodemon, --watch
    Repl,
    DevServer,
    BuildTool,  // build tools in watch mode
};

const char* to_string(ProcessType type);

struct ProcessInfo {
    ProcessType type = ProcessType::Oneshot;
    std::string command;
    std::string process_name;
    bool requires_input = false;
    bool is_persistent = false;
    bool needs_pty = false;
    bool needs_fullscreen = false;

    FocusHint focus_hint() const { return FocusHint{requires_input, is_persistent}; }
};

/**
 * @brief Classifies a launch command by its interaction and persistence pattern.
 *
 * @details
 * Special commands are matched on the first word before any pattern. Pattern
 * groups are tried most specific first: dev server, watcher, build tool,
 * interactive, REPL. Anything unmatched is a one-shot command. Results are
 * cached on the trimmed, lower-cased command line.
 */
class ProcessClassifier {
   public:
    ProcessClassifier();

    ProcessInfo classify(const std::string& command);

    void clear_cache();
    std::size_t cache_size() const;

   private:
    ProcessInfo make_info(ProcessType type,
                          const std::string& original,
                          const std::string& normalized) const;

    std::vector<std::pair<ProcessType, std::vector<std::regex>>> patterns_;
    std::unordered_map<std::string, ProcessInfo> special_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProcessInfo> cache_;
};

}  // namespace termroute
