#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "config/arrow/arrow_storage.pb.h"

namespace checkpoint::storage::common {

/*
  Arrow reports failures as Status; the snapshot stores report them as
  exceptions. `context` names the operation and object ("write w-1/..").
*/
template <typename T>
T OrThrow(arrow::Result<T> result, std::string_view context) {
  if (!result.ok()) {
    throw std::runtime_error(std::string(context) + ": " + result.status().ToString());
  }
  return std::move(result).ValueUnsafe();
}

inline void OrThrow(const arrow::Status& status, std::string_view context) {
  if (!status.ok()) {
    throw std::runtime_error(std::string(context) + ": " + status.ToString());
  }
}

// Writes the whole snapshot image and closes the stream. `flush` forces the
// bytes out of Arrow's buffers before Close().
inline void WriteImage(arrow::io::OutputStream& out, const arrow::Buffer& image, bool flush, std::string_view context) {
  OrThrow(out.Write(image.data(), image.size()), context);
  if (flush) {
    OrThrow(out.Flush(), context);
  }
  OrThrow(out.Close(), context);
}

// Reads a stored image; a short read is reported rather than returned.
inline std::shared_ptr<arrow::Buffer> ReadImage(arrow::io::RandomAccessFile& file, std::string_view context) {
  const auto size   = OrThrow(file.GetSize(), context);
  auto       buffer = OrThrow(file.ReadAt(0, size), context);
  if (buffer->size() != size) {
    throw std::runtime_error(std::string(context) + ": short read, expected " + std::to_string(size) + " bytes, got " +
                             std::to_string(buffer->size()));
  }
  return buffer;
}

inline std::string JoinPath(const std::string& root, const std::string& key) {
  if (root.empty()) return key;
  if (root.back() == '/') return root + key;
  return root + "/" + key;
}

/*
  Filesystem for an object storage connection plus the root path
  (bucket[/prefix]) that snapshot keys are joined onto.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const pb::arrow::storage::ObjectStorageConfig& object_storage_config);

} // namespace checkpoint::storage::common
