#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Flat key -> text mapping used as the persisted cache tier
class IKeyValueStore {
public:
  virtual ~IKeyValueStore() = default;
  virtual std::optional<std::string> get(const std::string& key) const = 0;
  virtual bool put(const std::string& key, const std::string& value) = 0;  // false on write failure
  virtual bool remove(const std::string& key) = 0;                          // false if absent
  virtual std::vector<std::string> keys() const = 0;
  virtual std::string describe() const = 0;
};

// One file per key inside a directory.
class FileKeyValueStore : public IKeyValueStore {
public:
  explicit FileKeyValueStore(std::string dir);

  std::optional<std::string> get(const std::string& key) const override;
  bool put(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;
  std::vector<std::string> keys() const override;
  std::string describe() const override { return "file:" + dir_; }

  // Percent-escapes everything outside [A-Za-z0-9._-] and appends ".json"
  static std::string fileNameForKey(const std::string& key);
  static std::string keyForFileName(const std::string& file_name);

  std::string pathForKey(const std::string& key) const;

private:
  std::string dir_;
};

class MemoryKeyValueStore : public IKeyValueStore {
public:
  std::optional<std::string> get(const std::string& key) const override;
  bool put(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;
  std::vector<std::string> keys() const override;
  std::string describe() const override { return "memory"; }

private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> entries_;
};
