/**
 * @file local_file_probe.cpp
 * @brief Implementation of the local file probe
 */

#include "kcenon/device_transfer/probe/local_file_probe.h"

#include <kcenon/device_transfer/core/checksum.h>
#include <kcenon/device_transfer/core/logging.h>

#include <filesystem>
#include <system_error>

namespace kcenon::device_transfer {

namespace {

auto free_space_at(const std::filesystem::path& path) -> uint64_t {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) {
        DT_LOG_DEBUG(log_category::probe,
                     "cannot read free space of " + path.string() + ": " + ec.message());
        return 0;
    }
    return static_cast<uint64_t>(info.available);
}

}  // namespace

auto local_file_probe::probe(const std::string& location,
                             const std::optional<std::string>& storage_context)
    -> result<file_state> {
    std::filesystem::path file_path(location);

    std::filesystem::path space_path;
    if (storage_context && !storage_context->empty()) {
        space_path = *storage_context;
    } else if (file_path.has_parent_path()) {
        space_path = file_path.parent_path();
    } else {
        space_path = ".";
    }
    auto free_space = free_space_at(space_path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return file_state::not_found(free_space);
    }

    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return file_state::not_found(free_space);
    }

    auto digest = checksum::md5_file(file_path);
    if (!digest) {
        DT_LOG_DEBUG(log_category::probe, location + ": " + digest.error().message);
        return file_state::not_found(free_space);
    }

    return file_state{digest.value(), static_cast<uint64_t>(size), free_space};
}

}  // namespace kcenon::device_transfer
