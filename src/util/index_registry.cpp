#include "jsonl_resumable/index_registry.hpp"
#include <filesystem>

namespace jr {

std::string IndexRegistry::key_for(const std::string& path) {
  return std::filesystem::weakly_canonical(std::filesystem::path(path)).string();
}

std::shared_ptr<JsonlIndex> IndexRegistry::acquire(const std::string& path,
                                                   const JsonlIndex::Config& cfg) {
  const std::string key = key_for(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(key);
  if (it != map_.end()) {
    if (!it->second->is_fresh()) it->second->update();
    return it->second;
  }
  auto idx = std::make_shared<JsonlIndex>(key, cfg);
  map_.emplace(key, idx);
  return idx;
}

bool IndexRegistry::evict(const std::string& path) {
  const std::string key = key_for(path);
  std::lock_guard<std::mutex> lk(mu_);
  return map_.erase(key) > 0;
}

void IndexRegistry::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  map_.clear();
}

std::size_t IndexRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.size();
}

bool IndexRegistry::contains(const std::string& path) const {
  const std::string key = key_for(path);
  std::lock_guard<std::mutex> lk(mu_);
  return map_.find(key) != map_.end();
}

}
