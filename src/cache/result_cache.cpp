#include "result_cache.h"
#include "core/errors.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

ResultCache::ResultCache(std::string static_dir, std::unique_ptr<IKeyValueStore> store, bool static_writable)
  : static_dir_(std::move(static_dir)), store_(std::move(store)), static_writable_(static_writable) {
  if (!store_) {
    store_ = std::make_unique<MemoryKeyValueStore>();
  }
}

std::string ResultCache::makeKey(const std::string& period, int zoom_level) {
  return period + "_" + std::to_string(zoom_level);
}

std::string ResultCache::storeKey(const std::string& key) {
  return "filterCache-" + key;
}

std::string ResultCache::staticPathFor(const std::string& key) const {
  return (fs::path(static_dir_) / (key + "_cache.json")).string();
}

std::mutex& ResultCache::keyMutex(const std::string& key) const {
  std::lock_guard<std::mutex> lk(registry_mutex_);
  auto& slot = key_mutexes_[key];
  if (!slot) slot = std::make_unique<std::mutex>();
  return *slot;
}

void ResultCache::remember(const std::string& key, const SelectionResult& result) {
  std::lock_guard<std::mutex> lk(memory_mutex_);
  memory_[key] = result;
}

std::optional<SelectionResult> ResultCache::readStatic(const std::string& key) const {
  if (static_dir_.empty()) return std::nullopt;

  const std::string path = staticPathFor(key);
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt; // no precomputed file: expected

  std::ostringstream ss;
  ss << in.rdbuf();
  try {
    SelectionResult r = parseSelection(ss.str());
    std::cout << "[ResultCache] loaded precomputed result from " << path << std::endl;
    return r;
  } catch (const std::exception& e) {
    std::cerr << "[ResultCache] ignoring unreadable static file " << path << ": " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::optional<SelectionResult> ResultCache::lookupLocked(const std::string& key, Source* source) {
  if (source) *source = Source::None;

  {
    std::lock_guard<std::mutex> lk(memory_mutex_);
    auto it = memory_.find(key);
    if (it != memory_.end()) {
      if (source) *source = Source::Memory;
      return it->second;
    }
  }

  if (auto r = readStatic(key)) {
    remember(key, *r);
    if (source) *source = Source::Static;
    return r;
  }

  if (auto blob = store_->get(storeKey(key))) {
    try {
      SelectionResult r = parseSelection(*blob);
      remember(key, r);
      if (source) *source = Source::Store;
      std::cout << "[ResultCache] loaded cached result from " << store_->describe() << " for " << key << std::endl;
      return r;
    } catch (const std::exception& e) {
      std::cerr << "[ResultCache] corrupt store entry for " << key << ": " << e.what() << std::endl;
    }
  }

  return std::nullopt;
}

bool ResultCache::putLocked(const std::string& key, const SelectionResult& result) {
  remember(key, result);
  if (!store_->put(storeKey(key), serializeSelection(result))) {
    std::cerr << "[ResultCache] failed to persist " << key << " to " << store_->describe() << std::endl;
    return false;
  }
  std::cout << "[ResultCache] cached result saved for " << key << std::endl;
  return true;
}

std::optional<SelectionResult> ResultCache::get(const std::string& key, Source* source) {
  std::lock_guard<std::mutex> lk(keyMutex(key));
  return lookupLocked(key, source);
}

bool ResultCache::put(const std::string& key, const SelectionResult& result) {
  std::lock_guard<std::mutex> lk(keyMutex(key));
  return putLocked(key, result);
}

void ResultCache::invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lk(keyMutex(key));

  {
    std::lock_guard<std::mutex> mlk(memory_mutex_);
    memory_.erase(key);
  }

  if (store_->remove(storeKey(key))) {
    std::cout << "[ResultCache] removed cached entry for " << key << std::endl;
  } else {
    std::cout << "[ResultCache] no cached entry found for " << key << std::endl;
  }

  if (static_writable_ && !static_dir_.empty()) {
    std::error_code ec;
    if (fs::remove(staticPathFor(key), ec)) {
      std::cout << "[ResultCache] removed static file " << staticPathFor(key) << std::endl;
    } else if (ec) {
      std::cerr << "[ResultCache] could not remove static file for " << key << ": " << ec.message() << std::endl;
    }
  }
}

std::string ResultCache::exportEntry(const std::string& key) const {
  std::lock_guard<std::mutex> lk(keyMutex(key));
  auto blob = store_->get(storeKey(key));
  if (!blob) {
    throw core::NoCachedDataError(key);
  }
  return *blob;
}

std::string ResultCache::exportToFile(const std::string& key, const std::string& dir) const {
  const std::string blob = exportEntry(key);

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create " + dir + ": " + ec.message());
  }

  const std::string path = (fs::path(dir) / (key + "_cache.json")).string();
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + path + " for writing");
  }
  out << blob;
  if (!out) {
    throw std::runtime_error("write failed for " + path);
  }
  std::cout << "[ResultCache] cache for " << key << " exported to " << path << std::endl;
  return path;
}

SelectionResult ResultCache::getOrCompute(const std::string& key,
                                          const std::function<SelectionResult()>& compute,
                                          Source* source) {
  std::lock_guard<std::mutex> lk(keyMutex(key));

  if (auto hit = lookupLocked(key, source)) {
    return *hit;
  }

  std::cout << "[ResultCache] cache miss: " << key << ", computing" << std::endl;
  SelectionResult fresh = compute();
  putLocked(key, fresh); // failure already logged; the result is still returned
  if (source) *source = Source::Computed;
  return fresh;
}

size_t ResultCache::memoryEntries() const {
  std::lock_guard<std::mutex> lk(memory_mutex_);
  return memory_.size();
}

const char* toString(ResultCache::Source s) {
  switch (s) {
    case ResultCache::Source::Memory:   return "memory";
    case ResultCache::Source::Static:   return "static";
    case ResultCache::Source::Store:    return "store";
    case ResultCache::Source::Computed: return "computed";
    default:                            return "none";
  }
}
