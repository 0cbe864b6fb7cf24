#include "internal/storage/object/object_snapshot_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::storage {

using namespace checkpoint::storage::common;

ObjectSnapshotStore::ObjectSnapshotStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), needs_directories_(fs_->type_name() == "local") {
}

/*
  Object key layout:

      <root_path>/<strategy>/<worker>/<generation>.snap
*/
std::string ObjectSnapshotStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  return JoinPath(root_path_, key);
}

/*
  Upload buffer as object.

  Object stores are atomic per PUT. A local filesystem writes in place, so
  there the image is staged as <path>.tmp and moved into place.
*/
void ObjectSnapshotStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) {
    throw std::invalid_argument("snapshot buffer must not be null");
  }

  auto       path   = ObjectPath(key);
  const auto staged = needs_directories_ ? path + std::string(kTemporarySuffix) : path;
  try {
    if (Exists(path)) {
      throw util::AlreadyExists("snapshot object already exists: " + key);
    }
    if (needs_directories_) {
      OrThrow(fs_->CreateDir(path.substr(0, path.rfind('/')), true), "create directory");
    }
    {
      auto out = OrThrow(fs_->OpenOutputStream(staged), "open " + staged);
      WriteImage(*out, *buffer, false, "write " + staged);
    }
    if (staged != path) {
      if (Exists(path)) {
        throw util::AlreadyExists("snapshot object already exists: " + key);
      }
      OrThrow(fs_->Move(staged, path), "move " + staged);
    }
  } catch (const util::AlreadyExists&) {
    if (staged != path) DiscardStaged(staged);
    throw;
  } catch (const std::runtime_error& e) {
    if (staged != path) DiscardStaged(staged);
    throw util::StorageWriteFailure("object write failed for " + key + ": " + e.what());
  }
}

bool ObjectSnapshotStore::Exists(const std::string& path) const {
  auto info = OrThrow(fs_->GetFileInfo(path), "stat " + path);
  return info.type() != arrow::fs::FileType::NotFound;
}

void ObjectSnapshotStore::DiscardStaged(const std::string& staged) {
  auto info = fs_->GetFileInfo(staged);
  if (info.ok() && info->type() == arrow::fs::FileType::NotFound) return;

  auto status = info.ok() ? fs_->DeleteFile(staged) : info.status();
  if (!status.ok()) {
    CHECKPOINT_LOG_WARN("staged snapshot cleanup failed",
                        {observability::StringField("path", staged), observability::StringField("error", status.ToString())});
  }
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectSnapshotStore::Get(const std::string& key) {
  auto path = ObjectPath(key);
  auto info = OrThrow(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("snapshot object not found: " + key);
  }

  auto input = OrThrow(fs_->OpenInputFile(info), "open " + path);
  return ReadImage(*input, "read " + path);
}

std::vector<std::string> ObjectSnapshotStore::List(const std::string& prefix) {
  auto slash = prefix.rfind('/');

  arrow::fs::FileSelector selector;
  selector.base_dir       = slash == std::string::npos ? root_path_ : JoinPath(root_path_, prefix.substr(0, slash));
  selector.recursive      = true;
  selector.allow_not_found = true;

  auto infos = OrThrow(fs_->GetFileInfo(selector), "list " + selector.base_dir);

  const auto               root_len = root_path_.empty() ? 0 : root_path_.size() + 1;
  std::vector<std::string> keys;
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::File) continue;
    if (info.path().size() <= root_len) continue;

    auto key = info.path().substr(root_len);
    if (IsTemporaryKey(key)) continue;
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    keys.push_back(std::move(key));
  }

  std::sort(keys.begin(), keys.end());
  return keys;
}

/*
  Delete object; absent objects are already deleted.
*/
void ObjectSnapshotStore::Remove(const std::string& key) {
  auto path = ObjectPath(key);
  auto info = OrThrow(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() == arrow::fs::FileType::NotFound) return;

  OrThrow(fs_->DeleteFile(path), "delete " + path);
}

} // namespace checkpoint::storage
