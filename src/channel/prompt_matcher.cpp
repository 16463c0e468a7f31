/**
 * @file prompt_matcher.cpp
 * @brief Implementation of prompt_matcher
 */

#include "kcenon/device_transfer/channel/prompt_matcher.h"

#include <algorithm>
#include <iterator>

namespace kcenon::device_transfer {

namespace {

auto last_line(const std::string& buffer) -> std::string {
    auto end = buffer.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return {};
    }
    auto begin = buffer.find_last_of('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    auto line = buffer.substr(begin, end - begin + 1);
    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    return line;
}

// Offset just past the line holding the echo of `command`
auto echo_end(const std::string& buffer, const std::string& command) -> std::size_t {
    auto pos = buffer.find(command);
    if (pos == std::string::npos) {
        return std::string::npos;
    }
    auto newline = buffer.find('\n', pos + command.size());
    return newline == std::string::npos ? std::string::npos : newline + 1;
}

// Chain from a level down to the base level, the level itself first
auto ancestry(const admin_channel_config& config, const std::string& name)
    -> std::vector<const privilege_level*> {
    std::vector<const privilege_level*> chain;
    const auto* level = config.find_level(name);
    while (level && chain.size() <= config.privilege_levels.size()) {
        chain.push_back(level);
        level = level->previous.empty() ? nullptr : config.find_level(level->previous);
    }
    return chain;
}

}  // namespace

prompt_matcher::prompt_matcher(const admin_channel_config& config) : config_(config) {
    for (const auto& level : config_.privilege_levels) {
        prompts_.emplace_back(level.name, std::regex(level.pattern));
    }
}

auto prompt_matcher::prompt_level(const std::string& buffer) const -> std::optional<std::string> {
    auto line = last_line(buffer);
    if (line.empty()) {
        return std::nullopt;
    }
    for (const auto& [name, pattern] : prompts_) {
        if (std::regex_search(line, pattern)) {
            return name;
        }
    }
    return std::nullopt;
}

auto prompt_matcher::command_completed(const std::string& buffer,
                                       const std::string& command) const -> bool {
    if (command.empty()) {
        return prompt_level(buffer).has_value();
    }
    auto start = echo_end(buffer, command);
    if (start == std::string::npos) {
        return false;
    }
    return prompt_level(buffer.substr(start)).has_value();
}

auto prompt_matcher::last_line_matches(const std::string& buffer, const std::regex& pattern)
    -> bool {
    auto line = last_line(buffer);
    return !line.empty() && std::regex_search(line, pattern);
}

auto prompt_matcher::clean_output(const std::string& raw, const std::string& command)
    -> std::string {
    std::string text;
    text.reserve(raw.size());
    std::copy_if(raw.begin(), raw.end(), std::back_inserter(text),
                 [](char c) { return c != '\r'; });

    // Anything up to the echo is a stale prompt redraw
    if (!command.empty() && text.find(command) != std::string::npos) {
        auto start = echo_end(text, command);
        text.erase(0, start == std::string::npos ? text.size() : start);
    }

    auto prompt_start = text.find_last_of('\n');
    text.erase(prompt_start == std::string::npos ? 0 : prompt_start);

    auto end = text.find_last_not_of(" \n");
    return end == std::string::npos ? std::string{} : text.substr(0, end + 1);
}

auto prompt_matcher::is_rejected(const std::string& output) const -> bool {
    return std::any_of(config_.failed_when_contains.begin(), config_.failed_when_contains.end(),
                       [&output](const std::string& marker) {
                           return output.find(marker) != std::string::npos;
                       });
}

auto prompt_matcher::path(const std::string& current, const std::string& target) const
    -> std::optional<std::vector<privilege_step>> {
    auto from = ancestry(config_, current);
    auto to = ancestry(config_, target);
    if (from.empty() || to.empty()) {
        return std::nullopt;
    }

    // Leave levels until reaching one that is on the target's chain
    std::vector<privilege_step> steps;
    std::size_t common = to.size();
    for (const auto* level : from) {
        auto it = std::find(to.begin(), to.end(), level);
        if (it != to.end()) {
            common = static_cast<std::size_t>(it - to.begin());
            break;
        }
        steps.push_back({level, false});
    }
    if (common == to.size()) {
        return std::nullopt;
    }

    // Then enter the target's chain from the common level upwards
    for (std::size_t i = common; i > 0; --i) {
        steps.push_back({to[i - 1], true});
    }
    return steps;
}

}  // namespace kcenon::device_transfer
