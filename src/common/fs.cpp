#include "clawboot/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace clawboot::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string rstrip(std::string value, const char ch) {
  while (!value.empty() && value.back() == ch) {
    value.pop_back();
  }
  return value;
}

std::vector<std::string> split(const std::string &value, const std::string &delimiter) {
  std::vector<std::string> parts;
  if (delimiter.empty()) {
    parts.push_back(value);
    return parts;
  }
  std::size_t start = 0;
  while (true) {
    const auto pos = value.find(delimiter, start);
    if (pos == std::string::npos) {
      parts.push_back(value.substr(start));
      break;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + delimiter.size();
  }
  return parts;
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path,
                                         std::optional<std::filesystem::perms> mode) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  if (mode.has_value()) {
    std::filesystem::permissions(path, *mode, std::filesystem::perm_options::replace, ec);
    if (ec) {
      return Result<std::filesystem::path>::failure("Failed to set permissions on " +
                                                    path.string() + ": " + ec.message());
    }
  }
  return Result<std::filesystem::path>::success(path);
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Unable to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("Failed reading " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content,
                         std::optional<std::filesystem::perms> mode) {
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return Status::error("Failed to create directory " + path.parent_path().string() + ": " +
                           ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return Status::error("Unable to write temporary file " + tmp_path.string());
  }
  file << content;
  file.close();
  if (!file) {
    return Status::error("Failed writing temporary file " + tmp_path.string());
  }

  std::error_code ec;
  if (mode.has_value()) {
    std::filesystem::permissions(tmp_path, *mode, std::filesystem::perm_options::replace, ec);
    if (ec) {
      std::filesystem::remove(tmp_path, ec);
      return Status::error("Failed to set permissions on " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return Status::error("Failed to atomically replace " + path.string() + ": " + reason);
  }
  return Status::success();
}

Status remove_if_exists(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return Status::error("Failed to remove " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace clawboot::common
