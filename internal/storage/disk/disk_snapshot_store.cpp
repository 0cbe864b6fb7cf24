#include "internal/storage/disk/disk_snapshot_store.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::storage {

using namespace checkpoint::storage::common;

DiskSnapshotStore::DiskSnapshotStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path DiskSnapshotStore::KeyPath(const std::string& key) const {
  ValidateKey(key);
  return root_ / key;
}

/*
  Atomic write:
      write tmp → flush → link to final → unlink tmp

  Linking fails when the final path exists, so an existing generation is
  never replaced.
*/
void DiskSnapshotStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) {
    throw std::invalid_argument("snapshot buffer must not be null");
  }

  auto final_path = KeyPath(key);
  auto tmp_path   = final_path.string() + std::string(kTemporarySuffix);

  if (std::filesystem::exists(final_path)) {
    throw util::AlreadyExists("snapshot object already exists: " + key);
  }

  try {
    std::filesystem::create_directories(final_path.parent_path());

    {
      auto out = OrThrow(arrow::io::FileOutputStream::Open(tmp_path), "open " + tmp_path);
      WriteImage(*out, *buffer, fsync_, "write " + tmp_path);
    }

    std::error_code ec;
    std::filesystem::create_hard_link(tmp_path, final_path, ec);
    if (ec == std::errc::file_exists) {
      throw util::AlreadyExists("snapshot object already exists: " + key);
    }
    if (ec) {
      throw std::runtime_error("link " + final_path.string() + ": " + ec.message());
    }
    std::filesystem::remove(tmp_path, ec);
  } catch (const util::AlreadyExists&) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  } catch (const std::exception& e) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw util::StorageWriteFailure("disk write failed for " + key + ": " + e.what());
  }
}

std::shared_ptr<arrow::Buffer> DiskSnapshotStore::Get(const std::string& key) {
  auto path = KeyPath(key);
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound("snapshot object not found: " + key);
  }

  auto file = OrThrow(arrow::io::ReadableFile::Open(path.string()), "open " + path.string());
  return ReadImage(*file, "read " + key);
}

std::vector<std::string> DiskSnapshotStore::List(const std::string& prefix) {
  // Only walk the deepest directory the prefix fully names.
  auto                  slash = prefix.rfind('/');
  std::filesystem::path base  = slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);

  std::vector<std::string> keys;
  std::error_code          ec;
  if (!std::filesystem::is_directory(base, ec)) {
    return keys;
  }

  for (auto it = std::filesystem::recursive_directory_iterator(base, ec); !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    if (!it->is_regular_file()) continue;

    auto key = std::filesystem::relative(it->path(), root_).generic_string();
    if (IsTemporaryKey(key)) continue;
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    keys.push_back(std::move(key));
  }
  if (ec) {
    throw std::runtime_error("failed to list " + base.string() + ": " + ec.message());
  }

  std::sort(keys.begin(), keys.end());
  return keys;
}

void DiskSnapshotStore::Remove(const std::string& key) {
  std::error_code ec;
  std::filesystem::remove(KeyPath(key), ec);
  if (ec) {
    throw std::runtime_error("failed to remove " + key + ": " + ec.message());
  }
}

} // namespace checkpoint::storage
