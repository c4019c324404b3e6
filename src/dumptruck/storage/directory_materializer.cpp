#include "dumptruck/storage/directory_materializer.hpp"

#include "dumptruck/util/log.hpp"

#include <system_error>

namespace dumptruck {

DirectoryMaterializer::DirectoryMaterializer(std::size_t cache_capacity)
    : done_{cache_capacity} {
}

auto DirectoryMaterializer::make_one(const std::filesystem::path& prefix)
    -> Result<void> {
  std::error_code ec;
  auto status = std::filesystem::status(prefix, ec);
  if (ec && status.type() != std::filesystem::file_type::not_found) {
    log::error("cannot stat {}: {}", prefix.string(), ec.message());
    return fail(Error::CreateDirectoryFailed);
  }
  if (std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      log::error("not a directory: {}", prefix.string());
      return fail(Error::NotADirectory);
    }
    return ok();
  }

  log::debug("mkdir: {}", prefix.string());
  if (std::filesystem::create_directory(prefix, ec) || !ec) {
    return ok();
  }
  // Lost a race with another creator: fine as long as it is a directory.
  std::error_code recheck;
  if (std::filesystem::is_directory(prefix, recheck)) {
    return ok();
  }
  log::error("failed to create directory {}: {}", prefix.string(),
             ec.message());
  return fail(Error::CreateDirectoryFailed);
}

auto DirectoryMaterializer::ensure_dir(const std::filesystem::path& path)
    -> Result<void> {
  require(!path.empty(), "directory path must not be empty");

  auto key = path.string();
  if (done_.get(key)) {
    return ok();
  }

  std::filesystem::path prefix;
  for (const auto& part : path) {
    prefix /= part;
    if (part == path.root_name() || part == path.root_directory() ||
        part == ".") {
      continue;
    }
    if (part.empty()) {
      // Trailing separator yields an empty element
      continue;
    }
    if (auto r = make_one(prefix); !r) {
      return r;
    }
  }

  done_.put(std::move(key), true);
  return ok();
}

}  // namespace dumptruck
