/**
 * @file transfer_types.h
 * @brief Value types produced and consumed by a single transfer run
 */

#ifndef KCENON_DEVICE_TRANSFER_CORE_TRANSFER_TYPES_H
#define KCENON_DEVICE_TRANSFER_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::device_transfer {

/**
 * @brief Fingerprint, size and free space of one file location
 *
 * An empty fingerprint is the "not found or inaccessible" sentinel. It is
 * an expected outcome of an idempotency check, not an error, so probes
 * return it as a regular value. A file_state is never modified after it
 * has been produced.
 */
class file_state {
public:
    /**
     * @brief Create a state for a file that exists
     * @param fingerprint Lowercase hex MD5 of the content
     * @param size File size in bytes
     * @param free_space Free bytes at the containing storage
     */
    file_state(std::string fingerprint, uint64_t size, uint64_t free_space)
        : fingerprint_(std::move(fingerprint)),
          size_(fingerprint_.empty() ? 0 : size),
          free_space_(free_space) {}

    /**
     * @brief Create the "not found" sentinel
     * @param free_space Free bytes at the containing storage (0 if unknown)
     */
    [[nodiscard]] static auto not_found(uint64_t free_space = 0) -> file_state {
        return file_state{std::string{}, 0, free_space};
    }

    [[nodiscard]] auto fingerprint() const -> const std::string& { return fingerprint_; }
    [[nodiscard]] auto size() const -> uint64_t { return size_; }
    [[nodiscard]] auto free_space() const -> uint64_t { return free_space_; }

    /**
     * @brief Check whether the probe found the file
     */
    [[nodiscard]] auto exists() const -> bool { return !fingerprint_.empty(); }

    /**
     * @brief Content equality; two missing files never match
     */
    [[nodiscard]] auto same_content(const file_state& other) const -> bool {
        return exists() && fingerprint_ == other.fingerprint_;
    }

private:
    std::string fingerprint_;
    uint64_t size_;
    uint64_t free_space_;
};

/**
 * @brief Result of one orchestrated transfer
 *
 * Callers should treat `verified` as the success signal. Within one run a
 * field that became true is never reset.
 *
 * `destination_existed` describes the destination as found by the
 * pre-check. The post-check only updates `verified`, so a fresh copy
 * reports {false, true, true} even though the file exists afterwards.
 */
struct transfer_outcome {
    bool destination_existed = false;  ///< destination had content before the copy
    bool transferred = false;          ///< bytes were moved over the bulk-copy channel
    bool verified = false;             ///< destination fingerprint matches the source

    [[nodiscard]] auto operator==(const transfer_outcome& other) const -> bool = default;
};

/**
 * @brief Progress callback: (source, destination, bytes copied, total bytes)
 */
using progress_sink = std::function<void(const std::string&, const std::string&,
                                         uint64_t, uint64_t)>;

/**
 * @brief Progress snapshot reported by a bulk-copy session per block
 */
struct copy_progress {
    uint64_t bytes_copied = 0;
    uint64_t total_bytes = 0;

    [[nodiscard]] auto percentage() const -> double {
        if (total_bytes == 0) return 100.0;
        return static_cast<double>(bytes_copied) / static_cast<double>(total_bytes) * 100.0;
    }
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CORE_TRANSFER_TYPES_H
