#pragma once

#include <string>
#include <vector>

namespace boxrun::common {

/// Escape a string for embedding inside a JSON string literal. Control characters
/// become \u00XX so arbitrary container output stays valid JSON.
[[nodiscard]] std::string json_escape(const std::string &value);

/// `"` + json_escape(value) + `"`.
[[nodiscard]] std::string json_quote(const std::string &value);

/// JSON array of quoted strings.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace boxrun::common
