#include "ProcessClassifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <string_view>

namespace termroute {

namespace {

std::string normalize(const std::string& command) {
    auto first = std::find_if_not(command.begin(), command.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(command.rbegin(), command.rend(),
                                 [](unsigned char c) { return std::isspace(c); })
                    .base();
    std::string out = first < last ? std::string(first, last) : std::string{};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split_words(const std::string& command) {
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < command.size()) {
        std::size_t end = command.find(' ', pos);
        if (end == std::string::npos) end = command.size();
        if (end > pos) words.emplace_back(command.substr(pos, end - pos));
        pos = end + 1;
    }
    return words;
}

std::vector<std::regex> compile(std::initializer_list<const char*> sources) {
    std::vector<std::regex> out;
    out.reserve(sources.size());
    for (const char* src : sources) {
        out.emplace_back(src, std::regex::ECMAScript | std::regex::optimize);
    }
    return out;
}

// "npm run dev" -> "npm-dev", "python manage.py runserver" -> "python-manage"
std::string extract_process_name(const std::string& command) {
    auto words = split_words(command);
    if (words.empty()) return "unknown";

    const std::string& first = words.front();
    if (first == "npm" && words.size() >= 3 && words[1] == "run") {
        return "npm-" + words[2];
    }
    if (first == "python" && words.size() >= 2 && words[1].ends_with(".py")) {
        return "python-" + words[1].substr(0, words[1].size() - 3);
    }
    return first;
}

bool needs_fullscreen(const std::string& command) {
    static constexpr std::array<std::string_view, 13> kFullscreen{
        "vi", "vim", "nvim", "emacs", "nano", "top", "htop",
        "btop", "less", "more", "man", "tmux", "screen"};
    return std::any_of(kFullscreen.begin(), kFullscreen.end(),
                       [&command](std::string_view cmd) { return command.starts_with(cmd); });
}

}  // namespace

const char* to_string(ProcessType type) {
    switch (type) {
        case ProcessType::Oneshot:
            return "oneshot";
        case ProcessType::Interactive:
            return "interactive";
        case ProcessType::Persistent:
            return "persistent";
        case ProcessType::Watcher:
            return "watcher";
        case ProcessType::Repl:
            return "repl";
        case ProcessType::DevServer:
            return "devServer";
        case ProcessType::BuildTool:
            return "buildTool";
    }
    return "unknown";
}

ProcessClassifier::ProcessClassifier() {
    // Order matters: most specific groups first
    patterns_.emplace_back(ProcessType::DevServer,
                           compile({
                               R"(^(npm|pnpm|yarn|bun)\s+run\s+(dev|start|serve))",
                               R"(^(npm|pnpm|yarn|bun)\s+(dev|start|serve))",
                               R"(^(next|vite|parcel|webpack-dev-server)(\s|$))",
                               R"(^(rails|bundle\s+exec\s+rails)\s+(server|s))",
                               R"(^(django-admin|python\s+manage\.py)\s+runserver)",
                               R"(^(flask|python\s+.*\.py)\s+run)",
                               R"(^(fastapi|uvicorn)(\s|$))",
                               R"(^(gatsby|nuxt)\s+(dev|develop))",
                               R"(^(hugo|jekyll)\s+serve)",
                               R"(^(flutter)\s+run)",
                               R"(^(expo|react-native)\s+start)",
                           }));

    patterns_.emplace_back(ProcessType::Watcher,
                           compile({
                               R"(^(watch)(\s|$))",
                               R"(^(nodemon)(\s|$))",
                               R"(^(tail)\s+(-f|--follow))",
                               R"(^(docker)\s+logs\s+(-f|--follow))",
                               R"(^(kubectl)\s+logs\s+(-f|--follow))",
                               R"(^(journalctl)\s+(-f|--follow))",
                               R"(--watch(\s|$))",
                               R"(--continuous(\s|$))",
                           }));

    patterns_.emplace_back(ProcessType::BuildTool,
                           compile({
                               R"(^(make)\s+watch)",
                               R"(^(gradle|gradlew).*--continuous)",
                               R"(^(cargo)\s+watch)",
                               R"(^(webpack)\s+--watch)",
                               R"(^(tsc|typescript)\s+--watch)",
                               R"(^(sass|less)\s+--watch)",
                               R"(^(rollup)\s+--watch)",
                               R"(^(esbuild)\s+--watch)",
                           }));

    patterns_.emplace_back(ProcessType::Interactive,
                           compile({
                               R"(^(vi|vim|nvim|emacs)(\s|$))",
                               R"(^(nano|micro|pico)(\s|$))",
                               R"(^(top|htop|btop|atop)(\s|$))",
                               R"(^(less|more)(\s|$))",
                               R"(^(man)(\s|$))",
                               R"(^(tmux|screen)(\s|$))",
                               R"(^(git)\s+(log|diff|show))",
                               R"(^(ssh)(\s|$))",
                               // Bare login shells, optionally with flags only
                               R"(^(bash|zsh|sh|fish|dash|ksh|tcsh|csh|pwsh)(\s+-[a-z-]+)*$)",
                               R"(^(ftp|sftp)(\s|$))",
                           }));

    patterns_.emplace_back(ProcessType::Repl,
                           compile({
                               R"(^(python|python3)$)",
                               R"(^(node|nodejs)$)",
                               R"(^(irb|ruby)(\s|$))",
                               R"(^(julia)(\s|$))",
                               R"(^(r)(\s|$))",
                               R"(^(scala)(\s|$))",
                               R"(^(clojure|clj)(\s|$))",
                               R"(^(ghci|runghc)(\s|$))",
                               R"(^(erl|iex)(\s|$))",
                               R"(^(psql|mysql|sqlite3|redis-cli)(\s|$))",
                               R"(^(claude|ai)(\s|$))",
                           }));

    ProcessInfo assistant;
    assistant.type = ProcessType::Repl;
    assistant.command = "claude";
    assistant.process_name = "claude";
    assistant.requires_input = true;
    assistant.is_persistent = true;
    assistant.needs_pty = true;
    special_.emplace("claude", std::move(assistant));
}

ProcessInfo ProcessClassifier::classify(const std::string& command) {
    const std::string normalized = normalize(command);

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = cache_.find(normalized); it != cache_.end()) {
        return it->second;
    }

    auto words = split_words(normalized);
    if (!words.empty()) {
        if (auto it = special_.find(words.front()); it != special_.end()) {
            cache_.emplace(normalized, it->second);
            return it->second;
        }
    }

    for (const auto& [type, regexes] : patterns_) {
        for (const auto& re : regexes) {
            if (std::regex_search(normalized, re)) {
                ProcessInfo info = make_info(type, command, normalized);
                spdlog::debug("ProcessClassifier: '{}' -> {}", normalized, to_string(type));
                cache_.emplace(normalized, info);
                return info;
            }
        }
    }

    ProcessInfo info = make_info(ProcessType::Oneshot, command, normalized);
    cache_.emplace(normalized, info);
    return info;
}

void ProcessClassifier::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    spdlog::debug("ProcessClassifier: cache cleared");
}

std::size_t ProcessClassifier::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

ProcessInfo ProcessClassifier::make_info(ProcessType type,
                                         const std::string& original,
                                         const std::string& normalized) const {
    ProcessInfo info;
    info.type = type;
    info.command = original;

    switch (type) {
        case ProcessType::Repl:
            info.requires_input = true;
            info.is_persistent = true;
            info.needs_pty = true;
            break;
        case ProcessType::Interactive:
            info.requires_input = true;
            info.is_persistent = true;
            info.needs_pty = true;
            info.needs_fullscreen = needs_fullscreen(normalized);
            break;
        case ProcessType::DevServer:
        case ProcessType::Watcher:
        case ProcessType::BuildTool:
        case ProcessType::Persistent:
            info.is_persistent = true;
            break;
        case ProcessType::Oneshot:
            return info;
    }

    info.process_name = extract_process_name(normalized);
    return info;
}

}  // namespace termroute
