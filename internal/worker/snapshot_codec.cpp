#include "internal/worker/snapshot_codec.hpp"

#include <limits>
#include <string>

#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::worker {

using namespace checkpoint::manager::v1;

std::shared_ptr<arrow::Buffer> EncodeSnapshot(const SnapshotHeader& header, const PartitionImage& image) {
  SnapshotBlob blob;
  *blob.mutable_header() = header;

  if (!image.SerializeToString(blob.mutable_state())) {
    throw util::SerializationFailure("failed to serialize partition image for worker " + header.worker_id());
  }
  blob.set_state_checksum(util::Crc32c::Compute(blob.state()));

  std::string bytes;
  if (!blob.SerializeToString(&bytes)) {
    throw util::SerializationFailure("failed to serialize snapshot blob for worker " + header.worker_id());
  }
  return arrow::Buffer::FromString(std::move(bytes));
}

DecodedSnapshot DecodeSnapshot(const arrow::Buffer& buffer) {
  if (buffer.size() > std::numeric_limits<int>::max()) {
    throw util::SerializationFailure("snapshot blob too large to decode");
  }

  SnapshotBlob blob;
  if (!blob.ParseFromArray(buffer.data(), static_cast<int>(buffer.size()))) {
    throw util::SerializationFailure("snapshot blob is not decodable");
  }
  if (util::Crc32c::Compute(blob.state()) != blob.state_checksum()) {
    throw util::SerializationFailure("snapshot state checksum mismatch for worker " + blob.header().worker_id());
  }

  DecodedSnapshot decoded;
  decoded.header = blob.header();
  if (!decoded.image.ParseFromString(blob.state())) {
    throw util::SerializationFailure("snapshot state is not decodable for worker " + blob.header().worker_id());
  }
  return decoded;
}

} // namespace checkpoint::worker
