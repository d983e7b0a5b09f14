#include "boxrun/config/config.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace boxrun::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".boxrun";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("BOXRUN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

std::optional<bool> parse_bool(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::uint32_t> parse_u32(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint32_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> parse_double(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> split_csv(const std::string &raw) {
  std::vector<std::string> out;
  std::stringstream stream(raw);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::trim(part);
    if (!part.empty()) {
      out.push_back(part);
    }
  }
  return out;
}

struct KeyBinding {
  std::function<std::string(const Config &)> get;
  std::function<bool(Config &, const std::string &)> set;
};

template <typename Section> KeyBinding bind(Section Config::*section, std::string Section::*field) {
  return KeyBinding{
      [=](const Config &c) { return c.*section.*field; },
      [=](Config &c, const std::string &v) {
        c.*section.*field = v;
        return true;
      },
  };
}

template <typename Section> KeyBinding bind(Section Config::*section, bool Section::*field) {
  return KeyBinding{
      [=](const Config &c) { return bool_to_toml(c.*section.*field); },
      [=](Config &c, const std::string &v) {
        const auto parsed = parse_bool(v);
        if (!parsed.has_value()) {
          return false;
        }
        c.*section.*field = *parsed;
        return true;
      },
  };
}

template <typename Section> KeyBinding bind(Section Config::*section, std::uint32_t Section::*field) {
  return KeyBinding{
      [=](const Config &c) { return std::to_string(c.*section.*field); },
      [=](Config &c, const std::string &v) {
        const auto parsed = parse_u32(v);
        if (!parsed.has_value()) {
          return false;
        }
        c.*section.*field = *parsed;
        return true;
      },
  };
}

template <typename Section> KeyBinding bind(Section Config::*section, double Section::*field) {
  return KeyBinding{
      [=](const Config &c) {
        std::ostringstream out;
        out << c.*section.*field;
        return out.str();
      },
      [=](Config &c, const std::string &v) {
        const auto parsed = parse_double(v);
        if (!parsed.has_value()) {
          return false;
        }
        c.*section.*field = *parsed;
        return true;
      },
  };
}

template <typename Section>
KeyBinding bind(Section Config::*section, std::vector<std::string> Section::*field) {
  return KeyBinding{
      [=](const Config &c) {
        std::string out;
        for (const auto &entry : c.*section.*field) {
          if (!out.empty()) {
            out += ",";
          }
          out += entry;
        }
        return out;
      },
      [=](Config &c, const std::string &v) {
        c.*section.*field = split_csv(v);
        return true;
      },
  };
}

const std::map<std::string, KeyBinding> &key_bindings() {
  static const std::map<std::string, KeyBinding> bindings = {
      {"sandbox.image", bind(&Config::sandbox, &SandboxConfig::image)},
      {"sandbox.image_repository", bind(&Config::sandbox, &SandboxConfig::image_repository)},
      {"sandbox.runtime_version", bind(&Config::sandbox, &SandboxConfig::runtime_version)},
      {"sandbox.image_variant", bind(&Config::sandbox, &SandboxConfig::image_variant)},
      {"sandbox.workdir", bind(&Config::sandbox, &SandboxConfig::workdir)},
      {"sandbox.venv_dir", bind(&Config::sandbox, &SandboxConfig::venv_dir)},
      {"sandbox.container_prefix", bind(&Config::sandbox, &SandboxConfig::container_prefix)},
      {"sandbox.docker_binary", bind(&Config::sandbox, &SandboxConfig::docker_binary)},
      {"sandbox.timeout_seconds", bind(&Config::sandbox, &SandboxConfig::timeout_seconds)},
      {"sandbox.run_as_host_user", bind(&Config::sandbox, &SandboxConfig::run_as_host_user)},
      {"sandbox.memory_limit", bind(&Config::sandbox, &SandboxConfig::memory_limit)},
      {"sandbox.cpu_limit", bind(&Config::sandbox, &SandboxConfig::cpu_limit)},
      {"sandbox.pids_limit", bind(&Config::sandbox, &SandboxConfig::pids_limit)},
      {"sandbox.env", bind(&Config::sandbox, &SandboxConfig::env)},
      {"staging.temp_prefix", bind(&Config::staging, &StagingConfig::temp_prefix)},
      {"results.dir", bind(&Config::results, &ResultsConfig::dir)},
      {"output.format", bind(&Config::output, &OutputConfig::format)},
      {"output.failure_exit_code", bind(&Config::output, &OutputConfig::failure_exit_code)},
      {"observability.backend", bind(&Config::observability, &ObservabilityConfig::backend)},
  };
  return bindings;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *image = std::getenv("BOXRUN_IMAGE"); image != nullptr && *image) {
    config.sandbox.image = image;
  }
  if (const char *version = std::getenv("BOXRUN_RUNTIME_VERSION"); version != nullptr && *version) {
    config.sandbox.runtime_version = version;
  }
  if (const char *timeout = std::getenv("BOXRUN_TIMEOUT_SECONDS"); timeout != nullptr && *timeout) {
    if (const auto parsed = parse_u32(timeout); parsed.has_value()) {
      config.sandbox.timeout_seconds = *parsed;
    }
  }
  if (const char *docker = std::getenv("BOXRUN_DOCKER"); docker != nullptr && *docker) {
    config.sandbox.docker_binary = docker;
  }
  if (const char *dir = std::getenv("BOXRUN_RESULTS_DIR"); dir != nullptr && *dir) {
    config.results.dir = expand_config_value(dir);
  }
  if (const char *format = std::getenv("BOXRUN_OUTPUT_FORMAT"); format != nullptr && *format) {
    config.output.format = common::to_lower(common::trim(format));
  }
  if (const char *policy = std::getenv("BOXRUN_FAILURE_EXIT_CODE"); policy != nullptr && *policy) {
    if (const auto parsed = parse_bool(policy); parsed.has_value()) {
      config.output.failure_exit_code = *parsed;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &sandbox = config.sandbox;
  sandbox.image = doc.get_string("sandbox.image", sandbox.image);
  sandbox.image_repository = doc.get_string("sandbox.image_repository", sandbox.image_repository);
  sandbox.runtime_version = doc.get_string("sandbox.runtime_version", sandbox.runtime_version);
  sandbox.image_variant = doc.get_string("sandbox.image_variant", sandbox.image_variant);
  sandbox.workdir = doc.get_string("sandbox.workdir", sandbox.workdir);
  sandbox.venv_dir = doc.get_string("sandbox.venv_dir", sandbox.venv_dir);
  sandbox.container_prefix = doc.get_string("sandbox.container_prefix", sandbox.container_prefix);
  sandbox.docker_binary =
      expand_config_value(doc.get_string("sandbox.docker_binary", sandbox.docker_binary));
  sandbox.timeout_seconds = static_cast<std::uint32_t>(
      doc.get_u64("sandbox.timeout_seconds", sandbox.timeout_seconds));
  sandbox.run_as_host_user = doc.get_bool("sandbox.run_as_host_user", sandbox.run_as_host_user);
  sandbox.memory_limit = doc.get_string("sandbox.memory_limit", sandbox.memory_limit);
  sandbox.cpu_limit = doc.get_double("sandbox.cpu_limit", sandbox.cpu_limit);
  sandbox.pids_limit =
      static_cast<std::uint32_t>(doc.get_u64("sandbox.pids_limit", sandbox.pids_limit));
  sandbox.env = doc.get_string_array("sandbox.env", sandbox.env);

  config.staging.temp_prefix = doc.get_string("staging.temp_prefix", config.staging.temp_prefix);
  config.results.dir = expand_config_value(doc.get_string("results.dir", config.results.dir));
  config.output.format = common::to_lower(doc.get_string("output.format", config.output.format));
  config.output.failure_exit_code =
      doc.get_bool("output.failure_exit_code", config.output.failure_exit_code);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (auto ensured = common::ensure_dir(path.parent_path()); !ensured.ok()) {
      return common::Status::error(ensured.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  const auto &sandbox = config.sandbox;
  file << "[sandbox]\n";
  if (!sandbox.image.empty()) {
    file << "image = " << common::quote_toml_string(sandbox.image) << "\n";
  }
  file << "image_repository = " << common::quote_toml_string(sandbox.image_repository) << "\n";
  file << "runtime_version = " << common::quote_toml_string(sandbox.runtime_version) << "\n";
  file << "image_variant = " << common::quote_toml_string(sandbox.image_variant) << "\n";
  file << "workdir = " << common::quote_toml_string(sandbox.workdir) << "\n";
  file << "venv_dir = " << common::quote_toml_string(sandbox.venv_dir) << "\n";
  file << "container_prefix = " << common::quote_toml_string(sandbox.container_prefix) << "\n";
  file << "docker_binary = " << common::quote_toml_string(sandbox.docker_binary) << "\n";
  file << "timeout_seconds = " << sandbox.timeout_seconds << "\n";
  file << "run_as_host_user = " << bool_to_toml(sandbox.run_as_host_user) << "\n";
  file << "memory_limit = " << common::quote_toml_string(sandbox.memory_limit) << "\n";
  file << "cpu_limit = " << sandbox.cpu_limit << "\n";
  file << "pids_limit = " << sandbox.pids_limit << "\n";
  file << "env = " << string_array_to_toml(sandbox.env) << "\n";

  file << "\n[staging]\n";
  file << "temp_prefix = " << common::quote_toml_string(config.staging.temp_prefix) << "\n";

  file << "\n[results]\n";
  file << "dir = " << common::quote_toml_string(config.results.dir) << "\n";

  file << "\n[output]\n";
  file << "format = " << common::quote_toml_string(config.output.format) << "\n";
  file << "failure_exit_code = " << bool_to_toml(config.output.failure_exit_code) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &sandbox = config.sandbox;

  if (sandbox.image.empty() && common::trim(sandbox.image_repository).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.image_repository must not be empty");
  }
  if (sandbox.image.empty() && common::trim(sandbox.runtime_version).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.runtime_version must not be empty");
  }
  if (!common::starts_with(sandbox.workdir, "/")) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.workdir must be an absolute container path: " + sandbox.workdir);
  }
  if (!common::starts_with(sandbox.venv_dir, "/")) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.venv_dir must be an absolute container path: " + sandbox.venv_dir);
  }
  if (sandbox.venv_dir == sandbox.workdir ||
      common::starts_with(sandbox.venv_dir, sandbox.workdir + "/")) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.venv_dir must live outside sandbox.workdir");
  }
  if (common::trim(sandbox.docker_binary).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.docker_binary must not be empty");
  }
  if (sandbox.cpu_limit < 0.0) {
    return common::Result<std::vector<std::string>>::failure("sandbox.cpu_limit must be >= 0");
  }
  for (const auto &entry : sandbox.env) {
    if (entry.find('=') == std::string::npos || entry.front() == '=') {
      return common::Result<std::vector<std::string>>::failure(
          "sandbox.env entries must look like NAME=value: " + entry);
    }
  }

  if (common::trim(config.results.dir).empty()) {
    return common::Result<std::vector<std::string>>::failure("results.dir must not be empty");
  }

  if (config.output.format != "human" && config.output.format != "json") {
    return common::Result<std::vector<std::string>>::failure("Invalid output.format: " +
                                                              config.output.format);
  }

  if (sandbox.timeout_seconds == 0) {
    warnings.push_back("sandbox.timeout_seconds is 0: runaway scripts are never stopped");
  }
  if (!config.output.failure_exit_code) {
    warnings.push_back(
        "output.failure_exit_code is false: dependency and script failures exit with 0");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string default_image(const SandboxConfig &sandbox) {
  if (!sandbox.image.empty()) {
    return sandbox.image;
  }
  std::string image = sandbox.image_repository + ":" + sandbox.runtime_version;
  if (!sandbox.image_variant.empty()) {
    image += "-" + sandbox.image_variant;
  }
  return image;
}

common::Result<std::string> get_config_value(const Config &config, const std::string &key) {
  const auto &bindings = key_bindings();
  const auto it = bindings.find(key);
  if (it == bindings.end()) {
    return common::Result<std::string>::failure("unknown key: " + key);
  }
  return common::Result<std::string>::success(it->second.get(config));
}

std::vector<std::string> config_keys() {
  std::vector<std::string> keys;
  for (const auto &[key, binding] : key_bindings()) {
    keys.push_back(key);
  }
  return keys;
}

common::Status set_config_value(Config &config, const std::string &key, const std::string &value) {
  const auto &bindings = key_bindings();
  const auto it = bindings.find(key);
  if (it == bindings.end()) {
    return common::Status::error("unknown key: " + key);
  }
  if (!it->second.set(config, value)) {
    return common::Status::error("invalid value for " + key + ": " + value);
  }
  return common::Status::success();
}

} // namespace boxrun::config
