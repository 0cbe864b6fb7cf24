#include "internal/storage/common/arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace checkpoint::storage::common {

namespace {

std::string RootPath(const pb::arrow::storage::ObjectStorageConfig& cfg) {
  std::string root = cfg.bucket();
  if (!cfg.prefix().empty()) {
    root = JoinPath(root, cfg.prefix());
  }
  while (!root.empty() && root.back() == '/') {
    root.pop_back();
  }
  return root;
}

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> MakeS3(const pb::arrow::storage::ObjectStorageConfig& cfg) {
  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

  const auto&          proto_options = cfg.s3();
  arrow::fs::S3Options options       = arrow::fs::S3Options::Defaults();
  if (!cfg.access_key().empty()) {
    options.ConfigureAccessKey(cfg.access_key(), cfg.secret_key());
  }
  if (!cfg.host().empty()) {
    options.endpoint_override = cfg.port() > 0 ? cfg.host() + ":" + std::to_string(cfg.port()) : cfg.host();
  }
  options.scheme = cfg.scheme().empty() ? "http" : cfg.scheme();
  if (!proto_options.region().empty()) {
    options.region = proto_options.region();
  }
  if (proto_options.connect_timeout() > 0) {
    options.connect_timeout = proto_options.connect_timeout();
  }
  if (proto_options.request_timeout() > 0) {
    options.request_timeout = proto_options.request_timeout();
  }
  options.force_virtual_addressing = proto_options.force_virtual_addressing();
  options.allow_bucket_creation    = proto_options.allow_bucket_creation();
  options.tls_ca_file_path         = proto_options.tls_ca_file_path();
  options.tls_verify_certificates  = proto_options.tls_verify_certificates();

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::static_pointer_cast<arrow::fs::FileSystem>(fs);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const pb::arrow::storage::ObjectStorageConfig& cfg) {
  switch (cfg.filesystem()) {
    case pb::arrow::storage::FILE_SYSTEM_S3: {
      if (cfg.bucket().empty()) {
        return arrow::Status::Invalid("object storage requires a bucket");
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, MakeS3(cfg));
      auto root = RootPath(cfg);
      if (cfg.s3().allow_bucket_creation()) {
        ARROW_RETURN_NOT_OK(fs->CreateDir(cfg.bucket(), false));
      }
      return std::make_pair(std::move(fs), std::move(root));
    }
    case pb::arrow::storage::FILE_SYSTEM_LOCAL: {
      if (cfg.uri().empty()) {
        return arrow::Status::Invalid("local object storage requires a uri");
      }
      auto fs = std::make_shared<arrow::fs::LocalFileSystem>();
      ARROW_RETURN_NOT_OK(fs->CreateDir(cfg.uri(), true));
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(fs), cfg.uri());
    }
    case pb::arrow::storage::FILE_SYSTEM_AUTO:
    default: {
      // host + bucket describe an S3-compatible endpoint; otherwise resolve the uri.
      if (cfg.uri().empty()) {
        pb::arrow::storage::ObjectStorageConfig s3 = cfg;
        s3.set_filesystem(pb::arrow::storage::FILE_SYSTEM_S3);
        return ResolveFileSystem(s3);
      }
      std::string resolved_path;
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(cfg.uri(), &resolved_path));
      return std::make_pair(std::move(fs), std::move(resolved_path));
    }
  }
}

} // namespace checkpoint::storage::common
