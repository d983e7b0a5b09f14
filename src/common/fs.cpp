#include "boxrun/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <memory>
#include <regex>
#include <sstream>
#include <vector>

namespace boxrun::common {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

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

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("Failed to read " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error("Failed to create directory: " + path.parent_path().string() + ": " +
                           ec.message());
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error("Failed to open " + path.string() + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    return Status::error("Failed to write " + path.string());
  }
  return Status::success();
}

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed");
  }
  return Result<std::string>::success(to_hex(data.data(), data.size()));
}

Result<std::string> sha256_file_hex(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Failed to open " + path.string());
  }

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::failure("Failed to initialise SHA-256");
  }

  std::array<char, 8192> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(got)) != 1) {
      return Result<std::string>::failure("SHA-256 update failed for " + path.string());
    }
  }
  if (in.bad()) {
    return Result<std::string>::failure("Failed to read " + path.string());
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    return Result<std::string>::failure("SHA-256 finalise failed for " + path.string());
  }
  return Result<std::string>::success(to_hex(digest.data(), digest_len));
}

Result<std::set<std::string>> list_entry_names(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return Result<std::set<std::string>>::failure("Failed to list " + dir.string() + ": " +
                                                  ec.message());
  }

  std::set<std::string> names;
  const auto end = std::filesystem::end(it);
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    names.insert(it->path().filename().string());
  }
  if (ec) {
    return Result<std::set<std::string>>::failure("Failed to list " + dir.string() + ": " +
                                                  ec.message());
  }
  return Result<std::set<std::string>>::success(std::move(names));
}

} // namespace boxrun::common
