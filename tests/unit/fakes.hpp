#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/fetch/origin_fetcher.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"

namespace lidar::testing {

inline std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void WriteText(const std::filesystem::path& path, const std::string& text) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

inline std::filesystem::path FreshDirectory(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "lidar_unit_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// Object store keeping object bodies in memory.
class FakeObjectStore final : public storage::ObjectStore {
 public:
  std::uint64_t PutFile(const std::string& key, const std::filesystem::path& source) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_puts) {
      throw std::runtime_error("object store unavailable");
    }
    objects_[key] = ReadText(source);
    return objects_[key].size();
  }

  std::uint64_t GetFile(const std::string& key, const std::filesystem::path& destination) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = objects_.find(key);
    if (it == objects_.end()) {
      throw std::runtime_error("no such object: " + key);
    }
    WriteText(destination, it->second);
    ++gets;
    return it->second.size();
  }

  bool Exists(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(key) > 0;
  }

  void DeletePrefix(const std::string& prefix) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = objects_.begin(); it != objects_.end();) {
      it = it->first.rfind(prefix, 0) == 0 ? objects_.erase(it) : std::next(it);
    }
  }

  std::string PublicUrl(const std::string& key) const override {
    return "https://objects.example/" + key;
  }

  std::string Object(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = objects_.find(key);
    return it == objects_.end() ? std::string() : it->second;
  }

  std::set<std::string> Keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string>       keys;
    for (const auto& [key, _] : objects_) keys.insert(key);
    return keys;
  }

  bool fail_puts = false;
  int  gets      = 0;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> objects_;
};

// Serves locators from a table; unknown locators fail like an unreachable origin.
class FakeFetcher final : public fetch::OriginFetcher {
 public:
  std::uint64_t Fetch(const std::string& locator, const std::filesystem::path& destination) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetches;
    auto it = bodies.find(locator);
    if (fail || it == bodies.end()) {
      throw util::TransientIoError("origin unreachable: " + locator);
    }
    WriteText(destination, it->second);
    return it->second.size();
  }

  std::map<std::string, std::string> bodies;
  bool                               fail    = false;
  int                                fetches = 0;

 private:
  std::mutex mutex_;
};

} // namespace lidar::testing
