#pragma once

#include "taildrive/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace taildrive {

/**
 * @brief Current time in unix seconds
 */
uint64_t unix_now();

/**
 * @brief Modification time of a regular file in unix seconds
 */
Result<uint64_t> file_mtime(const std::filesystem::path& path);

/**
 * @brief Modification time of any existing path (file or directory)
 */
Result<uint64_t> path_mtime(const std::filesystem::path& path);

/**
 * @brief Set access and modification time of `path` to `seconds`
 */
Result<void> set_file_mtime(const std::filesystem::path& path, uint64_t seconds);

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

/**
 * @brief Write `data` to `path`, creating parent directories
 *
 * The bytes go to a sibling temporary file first, which is then renamed
 * over `path`, so readers never observe a partial file.
 */
Result<void> write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);

Result<void> write_file(const std::filesystem::path& path, const std::string& data);

} // namespace taildrive
