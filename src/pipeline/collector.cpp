#include "boxrun/pipeline/collector.hpp"

#include "boxrun/common/fs.hpp"

#include <algorithm>

namespace boxrun::pipeline {

namespace {

using CollectResult = common::Result<std::vector<CapturedFile>, RunError>;

CollectResult collect_failure(std::string message) {
  return CollectResult::failure(
      RunError{.kind = ErrorKind::InternalError, .message = std::move(message)});
}

common::Status reset_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    return common::Status::error("failed to clear " + dir.string() + ": " + ec.message());
  }
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return common::Status::error("failed to create " + dir.string() + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace

common::Result<std::vector<std::string>>
ResultCollector::new_file_names(const std::filesystem::path &staging,
                                const std::set<std::string> &pre_existing) {
  std::error_code ec;
  std::filesystem::directory_iterator it(staging, ec);
  if (ec) {
    return common::Result<std::vector<std::string>>::failure("failed to scan " +
                                                             staging.string() + ": " +
                                                             ec.message());
  }

  std::vector<std::string> names;
  const auto end = std::filesystem::end(it);
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return common::Result<std::vector<std::string>>::failure("failed to scan " +
                                                               staging.string() + ": " +
                                                               ec.message());
    }
    std::error_code status_ec;
    const auto status = it->symlink_status(status_ec);
    if (status_ec || !std::filesystem::is_regular_file(status)) {
      continue;
    }
    auto name = it->path().filename().string();
    if (!pre_existing.contains(name)) {
      names.push_back(std::move(name));
    }
  }
  if (ec) {
    return common::Result<std::vector<std::string>>::failure("failed to scan " +
                                                             staging.string() + ": " +
                                                             ec.message());
  }
  std::sort(names.begin(), names.end());
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

common::Result<std::vector<CapturedFile>, RunError>
ResultCollector::collect(const std::filesystem::path &staging,
                         const std::set<std::string> &pre_existing,
                         const std::filesystem::path &destination) const {
  if (destination.empty()) {
    return collect_failure("results directory is empty");
  }
  if (auto status = reset_directory(destination); !status.ok()) {
    return collect_failure(status.error());
  }

  auto names = new_file_names(staging, pre_existing);
  if (!names.ok()) {
    return collect_failure(names.error());
  }

  // Partial results never survive: any failure below wipes the destination again.
  const auto abandon = [&destination](std::string message) {
    if (auto status = reset_directory(destination); !status.ok()) {
      message += "; " + status.error();
    }
    return collect_failure(std::move(message));
  };

  std::vector<CapturedFile> captured;
  captured.reserve(names.value().size());
  for (const auto &name : names.value()) {
    const auto source = staging / name;
    const auto target = destination / name;
    std::error_code ec;
    std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
      return abandon("failed to copy " + name + ": " + ec.message());
    }
    const auto size = std::filesystem::file_size(target, ec);
    if (ec) {
      return abandon("failed to stat " + name + ": " + ec.message());
    }
    auto digest = common::sha256_file_hex(target);
    if (!digest.ok()) {
      return abandon(digest.error());
    }
    captured.push_back(
        CapturedFile{.name = name, .size = static_cast<std::uint64_t>(size),
                     .sha256 = std::move(digest.value())});
  }

  return CollectResult::success(std::move(captured));
}

} // namespace boxrun::pipeline
