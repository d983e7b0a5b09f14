#include "boxrun/common/toml.hpp"

#include "boxrun/common/fs.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace boxrun::common {

namespace {

// Tracks whether position i of `text` is inside a basic ("...") or literal ('...') string.
class QuoteTracker {
public:
  void feed(const std::string &text, const std::size_t i) {
    const char ch = text[i];
    if (quote_ == 0) {
      if (ch == '"' || ch == '\'') {
        quote_ = ch;
      }
      return;
    }
    if (ch == quote_ && !(quote_ == '"' && i > 0 && text[i - 1] == '\\')) {
      quote_ = 0;
    }
  }

  [[nodiscard]] bool inside() const { return quote_ != 0; }

private:
  char quote_ = 0;
};

std::string strip_comment(const std::string &line) {
  QuoteTracker quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const bool was_inside = quotes.inside();
    quotes.feed(line, i);
    if (!was_inside && !quotes.inside() && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  QuoteTracker quotes;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const bool was_inside = quotes.inside();
    quotes.feed(array_value, i);
    if (!was_inside && !quotes.inside() && array_value[i] == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(array_value[i]);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }
  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

template <typename Int> bool parse_integer(const std::string &raw, Int &out) {
  const std::string normalized = trim(raw);
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, const int fallback) const {
  const auto it = values.find(key);
  int parsed = 0;
  if (it == values.end() || !parse_integer(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_integer(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  if (normalized.empty()) {
    return fallback;
  }
  errno = 0;
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (errno != 0 || end != normalized.c_str() + normalized.size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }
  return values_out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (!document.values.emplace(full_key, value).second) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace boxrun::common
