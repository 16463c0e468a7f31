/**
 * @file prompt_matcher.h
 * @brief Prompt recognition and output cleanup for interactive CLI sessions
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_PROMPT_MATCHER_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_PROMPT_MATCHER_H

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "kcenon/device_transfer/channel/ssh_config.h"

namespace kcenon::device_transfer {

/**
 * @brief One move between adjacent privilege levels
 */
struct privilege_step {
    const privilege_level* level = nullptr;  ///< level entered or left
    bool escalate = true;                    ///< true: enter `level`, false: leave it
};

/**
 * @brief Matches prompts of the configured privilege levels
 */
class prompt_matcher {
public:
    explicit prompt_matcher(const admin_channel_config& config);

    /**
     * @brief Level whose prompt is the last line of `buffer`
     */
    [[nodiscard]] auto prompt_level(const std::string& buffer) const -> std::optional<std::string>;

    /**
     * @brief Whether `buffer` holds the echo of `command` followed by a prompt
     *
     * A prompt seen before the echo belongs to an earlier write (a
     * keep-alive redraw) and does not end the command.
     */
    [[nodiscard]] auto command_completed(const std::string& buffer,
                                         const std::string& command) const -> bool;

    /**
     * @brief Whether the last line of `buffer` matches `pattern`
     */
    [[nodiscard]] static auto last_line_matches(const std::string& buffer,
                                                const std::regex& pattern) -> bool;

    /**
     * @brief Remove echo of `command` and what precedes it, the trailing
     * prompt and CR characters
     */
    [[nodiscard]] static auto clean_output(const std::string& raw, const std::string& command)
        -> std::string;

    /**
     * @brief Whether output contains one of the rejection markers
     */
    [[nodiscard]] auto is_rejected(const std::string& output) const -> bool;

    /**
     * @brief Steps leading from `current` to `target`
     * @return Empty optional when either level is unknown or unreachable
     */
    [[nodiscard]] auto path(const std::string& current, const std::string& target) const
        -> std::optional<std::vector<privilege_step>>;

private:
    const admin_channel_config& config_;
    std::vector<std::pair<std::string, std::regex>> prompts_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_PROMPT_MATCHER_H
