#include "kv_store.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
  const std::string kSuffix = ".json";

  bool isSafeChar(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '-';
  }

  int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  }
}

FileKeyValueStore::FileKeyValueStore(std::string dir) : dir_(std::move(dir)) {}

std::string FileKeyValueStore::fileNameForKey(const std::string& key) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(key.size() + kSuffix.size());
  for (unsigned char c : key) {
    if (isSafeChar(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out + kSuffix;
}

std::string FileKeyValueStore::keyForFileName(const std::string& file_name) {
  std::string stem = file_name;
  if (stem.size() >= kSuffix.size() &&
      stem.compare(stem.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
    stem.resize(stem.size() - kSuffix.size());
  }

  std::string out;
  out.reserve(stem.size());
  for (size_t i = 0; i < stem.size(); ++i) {
    if (stem[i] == '%' && i + 2 < stem.size()) {
      const int hi = hexValue(stem[i + 1]);
      const int lo = hexValue(stem[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(stem[i]);
  }
  return out;
}

std::string FileKeyValueStore::pathForKey(const std::string& key) const {
  return (fs::path(dir_) / fileNameForKey(key)).string();
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) const {
  std::ifstream in(pathForKey(key), std::ios::binary);
  if (!in) return std::nullopt;

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    std::cerr << "[FileKeyValueStore] read failed for key=" << key << std::endl;
    return std::nullopt;
  }
  return ss.str();
}

bool FileKeyValueStore::put(const std::string& key, const std::string& value) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    std::cerr << "[FileKeyValueStore] cannot create " << dir_ << ": " << ec.message() << std::endl;
    return false;
  }

  // Write beside the target, then rename over it
  const std::string target = pathForKey(key);
  const std::string tmp = target + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "[FileKeyValueStore] cannot open " << tmp << " for writing" << std::endl;
      return false;
    }
    out << value;
    out.flush();
    if (!out) {
      std::cerr << "[FileKeyValueStore] write failed for " << tmp << std::endl;
      fs::remove(tmp, ec);
      return false;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::cerr << "[FileKeyValueStore] rename to " << target << " failed: " << ec.message() << std::endl;
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool FileKeyValueStore::remove(const std::string& key) {
  std::error_code ec;
  const bool removed = fs::remove(pathForKey(key), ec);
  if (ec) {
    std::cerr << "[FileKeyValueStore] remove failed for key=" << key << ": " << ec.message() << std::endl;
    return false;
  }
  return removed;
}

std::vector<std::string> FileKeyValueStore::keys() const {
  std::vector<std::string> out;
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) return out;

  for (const auto& entry : fs::directory_iterator(dir_, ec)) {
    if (!entry.is_regular_file()) continue;
    const std::string name = entry.path().filename().string();
    if (name.size() <= kSuffix.size() ||
        name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0) {
      continue;
    }
    out.push_back(keyForFileName(name));
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

bool MemoryKeyValueStore::put(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_[key] = value;
  return true;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.erase(key) > 0;
}

std::vector<std::string> MemoryKeyValueStore::keys() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [k, v] : entries_) out.push_back(k);
  return out;
}
