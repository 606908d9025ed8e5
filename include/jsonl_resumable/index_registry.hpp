#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "jsonl_resumable/jsonl_index.hpp"

namespace jr {

// Shares one JsonlIndex per data file among callers. Keys are canonical
// paths, so "./a.jsonl" and "/abs/a.jsonl" map to the same index.
class IndexRegistry {
public:
  // Cached index for `path`, created with `cfg` on first use. A cached
  // index whose file changed since it was built is brought up to date with
  // update(). `cfg` is ignored for indices that already exist.
  std::shared_ptr<JsonlIndex> acquire(const std::string& path,
                                      const JsonlIndex::Config& cfg = {});

  // Drop the cached entry. Holders of the shared_ptr keep a working index.
  bool evict(const std::string& path);
  void clear();
  std::size_t size() const;
  bool contains(const std::string& path) const;

private:
  static std::string key_for(const std::string& path);

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<JsonlIndex>> map_;
};

}
