#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace lidar::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Resolves a filesystem URI ("s3://bucket/prefix?endpoint_override=...",
  "gs://...", "file:///data") or a plain local path into the filesystem and
  the root path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path);

// Content type recorded on uploaded objects, from the key's extension.
std::string ContentTypeFor(const std::string& key);

} // namespace lidar::storage::common
