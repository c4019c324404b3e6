#pragma once

#include "dumptruck/core/constants.hpp"
#include "dumptruck/core/error.hpp"
#include "dumptruck/core/lru_cache.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace dumptruck {

// mkdir -p with memoization per exact path string. A path materialized once
// is not checked against the filesystem again by this instance.
class DirectoryMaterializer {
public:
  explicit DirectoryMaterializer(
      std::size_t cache_capacity = defaults::kCacheCapacity);

  // Creates every missing prefix of `path`. Fails with Error::NotADirectory
  // when a prefix exists as something else. Throws ContractViolation on an
  // empty path.
  [[nodiscard]] auto ensure_dir(const std::filesystem::path& path)
      -> Result<void>;

  [[nodiscard]] auto is_materialized(const std::filesystem::path& path) const
      -> bool {
    return done_.contains(path.string());
  }

private:
  [[nodiscard]] static auto make_one(const std::filesystem::path& prefix)
      -> Result<void>;

  LruCache<std::string, bool> done_;
};

}  // namespace dumptruck
