#include "internal/storage/object_store.hpp"

namespace lidar::storage {

std::string JoinKey(const std::string& prefix, const std::string& name) {
  if (prefix.empty()) {
    return name;
  }
  std::string key = prefix;
  while (!key.empty() && key.back() == '/') {
    key.pop_back();
  }
  std::size_t start = 0;
  while (start < name.size() && name[start] == '/') {
    ++start;
  }
  return key + "/" + name.substr(start);
}

std::size_t UploadDirectory(ObjectStore& store, const std::filesystem::path& directory, const std::string& prefix) {
  std::size_t uploaded = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(directory)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const auto relative = std::filesystem::relative(entry.path(), directory).generic_string();
    store.PutFile(JoinKey(prefix, relative), entry.path());
    ++uploaded;
  }
  return uploaded;
}

} // namespace lidar::storage
