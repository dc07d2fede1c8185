#pragma once

#include "clawboot/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clawboot::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string rstrip(std::string value, char ch);

[[nodiscard]] std::vector<std::string> split(const std::string &value,
                                             const std::string &delimiter);

[[nodiscard]] Result<std::filesystem::path>
ensure_dir(const std::filesystem::path &path,
           std::optional<std::filesystem::perms> mode = std::nullopt);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes to `<path>.tmp`, applies `mode` to the temporary file, then renames
/// it over `path`. A crash leaves either the old file or the new one.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content,
                                       std::optional<std::filesystem::perms> mode = std::nullopt);

[[nodiscard]] Status remove_if_exists(const std::filesystem::path &path);

inline constexpr std::filesystem::perms OWNER_READ_WRITE =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
inline constexpr std::filesystem::perms OWNER_ALL = std::filesystem::perms::owner_all;

} // namespace clawboot::common
