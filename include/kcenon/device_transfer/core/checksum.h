/**
 * @file checksum.h
 * @brief Content fingerprint utilities
 */

#ifndef KCENON_DEVICE_TRANSFER_CORE_CHECKSUM_H
#define KCENON_DEVICE_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/device_transfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::device_transfer {

/**
 * @brief MD5 fingerprints as produced by network devices' `verify /md5`
 *
 * Hashing goes through the OpenSSL EVP interface. Digests are returned as
 * 32 lowercase hex characters so they compare directly with the device
 * output.
 */
class checksum {
public:
    /// Read size used when streaming a file through the digest
    static constexpr std::size_t read_block_size = 64 * 1024;

    /**
     * @brief Calculate MD5 of a file
     * @param path Path to the file
     * @return Hex digest, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto md5_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate MD5 of a memory buffer
     * @param data Input data span
     * @return Hex digest
     */
    [[nodiscard]] static auto md5(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Check that a string looks like an MD5 hex digest
     */
    [[nodiscard]] static auto is_md5_hex(const std::string& value) -> bool;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CORE_CHECKSUM_H
