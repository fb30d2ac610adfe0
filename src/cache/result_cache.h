#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "cache/kv_store.h"
#include "declutter/selection.h"

/**
 * Memoizes declutter results per "<period>_<zoomLevel>" key.
 *
 * Lookup order:
 *   1. in-memory map
 *   2. static precomputed file  <static_dir>/<key>_cache.json  (read-only)
 *   3. persisted store entry    "filterCache-<key>"
 *   4. miss (getOrCompute then computes and writes tier 3)
 *
 * Operations on one key are serialized by a per-key mutex; operations on
 * different keys do not wait for each other.
 */
class ResultCache {
public:
  enum class Source { None, Memory, Static, Store, Computed };

  ResultCache(std::string static_dir, std::unique_ptr<IKeyValueStore> store, bool static_writable = false);

  static std::string makeKey(const std::string& period, int zoom_level);
  static std::string storeKey(const std::string& key);
  std::string staticPathFor(const std::string& key) const;

  // std::nullopt on miss; never throws for unknown keys
  std::optional<SelectionResult> get(const std::string& key, Source* source = nullptr);

  // Writes memory and the persisted store. Store failures are logged and
  // reported as false; the in-memory copy is kept either way.
  bool put(const std::string& key, const SelectionResult& result);

  // Drops memory + store entry for this key (and the static file when writable)
  void invalidate(const std::string& key);

  // Serialized store entry; throws core::NoCachedDataError when absent
  std::string exportEntry(const std::string& key) const;

  // Writes the store entry to <dir>/<key>_cache.json and returns the path
  std::string exportToFile(const std::string& key, const std::string& dir) const;

  SelectionResult getOrCompute(const std::string& key,
                               const std::function<SelectionResult()>& compute,
                               Source* source = nullptr);

  size_t memoryEntries() const;
  const IKeyValueStore& store() const { return *store_; }

private:
  std::mutex& keyMutex(const std::string& key) const;
  std::optional<SelectionResult> lookupLocked(const std::string& key, Source* source);
  bool putLocked(const std::string& key, const SelectionResult& result);
  std::optional<SelectionResult> readStatic(const std::string& key) const;
  void remember(const std::string& key, const SelectionResult& result);

  std::string static_dir_;
  std::unique_ptr<IKeyValueStore> store_;
  bool static_writable_;

  mutable std::mutex registry_mutex_;
  mutable std::unordered_map<std::string, std::unique_ptr<std::mutex>> key_mutexes_;

  mutable std::mutex memory_mutex_;
  std::unordered_map<std::string, SelectionResult> memory_;
};

const char* toString(ResultCache::Source s);
