/**
 * @file capability_profile.h
 * @brief Device-specific description of bulk-copy capability settings
 */

#ifndef KCENON_DEVICE_TRANSFER_CAPABILITY_CAPABILITY_PROFILE_H
#define KCENON_DEVICE_TRANSFER_CAPABILITY_CAPABILITY_PROFILE_H

#include <optional>
#include <string>
#include <vector>

namespace kcenon::device_transfer {

/**
 * @brief One configuration setting, optionally carrying a value
 *
 * `ip scp server enable` is a flag (no value); `ip ssh bulk-mode 131072`
 * has key `ip ssh bulk-mode` and value `131072`.
 */
struct capability_setting {
    std::string key;
    std::optional<std::string> value;

    [[nodiscard]] auto operator==(const capability_setting& other) const -> bool = default;
};

/**
 * @brief Strategy describing how a device exposes bulk-copy capability
 *
 * The negotiator owns the state machine; a profile only knows the device
 * syntax: which read-only command shows the relevant configuration, how to
 * read it back into settings, which settings a transfer needs, and how a
 * setting is written or removed.
 */
class capability_profile {
public:
    virtual ~capability_profile() = default;

    /// Read-only command showing the current values of the relevant settings
    [[nodiscard]] virtual auto inspect_command() const -> std::string = 0;

    /// Settings currently present according to the inspection output
    [[nodiscard]] virtual auto parse_settings(const std::string& output) const
        -> std::vector<capability_setting> = 0;

    /// Settings a bulk copy needs
    [[nodiscard]] virtual auto required_settings() const -> std::vector<capability_setting> = 0;

    /// Directive writing a setting
    [[nodiscard]] virtual auto render(const capability_setting& setting) const -> std::string {
        return setting.value ? setting.key + " " + *setting.value : setting.key;
    }

    /// Directive removing a setting
    [[nodiscard]] virtual auto render_removal(const capability_setting& setting) const
        -> std::string {
        return "no " + setting.key;
    }
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CAPABILITY_CAPABILITY_PROFILE_H
