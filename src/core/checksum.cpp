/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/device_transfer/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace kcenon::device_transfer {

namespace {

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto new_md5_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

}  // namespace

auto checksum::md5_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    auto ctx = new_md5_context();
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "EVP MD5 initialization failed"});
    }

    std::vector<char> buffer(read_block_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "EVP MD5 update failed"});
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return unexpected(error{error_code::internal_error, "EVP MD5 finalization failed"});
    }

    return digest_to_hex(digest.data(), digest_len);
}

auto checksum::md5(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_md5(), nullptr);
    return digest_to_hex(digest.data(), digest_len);
}

auto checksum::is_md5_hex(const std::string& value) -> bool {
    if (value.size() != 32) {
        return false;
    }
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace kcenon::device_transfer
