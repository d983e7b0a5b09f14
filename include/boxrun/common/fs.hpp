#pragma once

#include "boxrun/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>

namespace boxrun::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

/// Hex string built from `bytes` bytes of OpenSSL CSPRNG output.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

/// SHA-256 of a file's contents, lowercase hex.
[[nodiscard]] Result<std::string> sha256_file_hex(const std::filesystem::path &path);

/// Names of the direct entries of `dir` (files, directories, links alike).
[[nodiscard]] Result<std::set<std::string>> list_entry_names(const std::filesystem::path &dir);

} // namespace boxrun::common
