#include "object_arrow_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include <fstream>
#include <stdexcept>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"

namespace lidar::storage {

using namespace lidar::storage::common;

namespace {

constexpr std::size_t kChunkBytes = 4 * 1024 * 1024;

void ValidateKey(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
    throw std::invalid_argument("invalid object key: " + key);
  }
}

} // namespace

ObjectArrowStore::ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string public_base_url)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), public_base_url_(std::move(public_base_url)) {
}

std::shared_ptr<ObjectArrowStore> ObjectArrowStore::FromUri(const std::string& object_root, const std::string& public_base_url) {
  auto [fs, root_path] = Unwrap(ResolveFileSystem(object_root));
  return std::make_shared<ObjectArrowStore>(std::move(fs), std::move(root_path), public_base_url);
}

/*
  Object key layout:

      <root_path>/<key>
*/
std::string ObjectArrowStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  return JoinKey(root_path_, key);
}

std::uint64_t ObjectArrowStore::PutFile(const std::string& key, const std::filesystem::path& source) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + source.string() + " for upload");
  }

  const auto path   = ObjectPath(key);
  const auto slash  = path.rfind('/');
  if (slash != std::string::npos && slash > 0) {
    Unwrap(fs_->CreateDir(path.substr(0, slash), /*recursive=*/true));
  }

  auto metadata = arrow::key_value_metadata({"Content-Type"}, {ContentTypeFor(key)});
  auto out      = Unwrap(fs_->OpenOutputStream(path, metadata));

  std::vector<char> chunk(kChunkBytes);
  std::uint64_t     written = 0;
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto count = in.gcount();
    if (count <= 0) {
      break;
    }
    Unwrap(out->Write(chunk.data(), count));
    written += static_cast<std::uint64_t>(count);
  }
  if (in.bad()) {
    throw std::runtime_error("read error on " + source.string());
  }
  Unwrap(out->Close());
  return written;
}

std::uint64_t ObjectArrowStore::GetFile(const std::string& key, const std::filesystem::path& destination) {
  auto input = Unwrap(fs_->OpenInputStream(ObjectPath(key)));

  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + destination.string() + " for writing");
  }

  std::uint64_t read = 0;
  while (true) {
    auto buffer = Unwrap(input->Read(static_cast<std::int64_t>(kChunkBytes)));
    if (buffer->size() == 0) {
      break;
    }
    out.write(reinterpret_cast<const char*>(buffer->data()), buffer->size());
    read += static_cast<std::uint64_t>(buffer->size());
  }
  Unwrap(input->Close());

  out.close();
  if (!out) {
    throw std::runtime_error("write error on " + destination.string());
  }
  return read;
}

bool ObjectArrowStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

void ObjectArrowStore::DeletePrefix(const std::string& prefix) {
  const auto path = ObjectPath(prefix);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  switch (info.type()) {
    case arrow::fs::FileType::Directory:
      Unwrap(fs_->DeleteDir(path));
      break;
    case arrow::fs::FileType::File:
      Unwrap(fs_->DeleteFile(path));
      break;
    default:
      break;
  }
}

std::string ObjectArrowStore::PublicUrl(const std::string& key) const {
  ValidateKey(key);
  if (public_base_url_.empty()) {
    return JoinKey(root_path_, key);
  }
  return JoinKey(public_base_url_, key);
}

} // namespace lidar::storage
