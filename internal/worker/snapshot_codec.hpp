#pragma once

#include <arrow/buffer.h>

#include <memory>

#include "checkpoint/manager/v1_types.hpp"

namespace checkpoint::worker {

/*
  Snapshot blob:

      SnapshotBlob {
        header          worker / strategy / generation / offsets
        state           serialized PartitionImage
        state_checksum  CRC32C(state)
      }

  The record stored in the manifest carries CRC32C of the whole blob;
  state_checksum lets a decoder reject a blob on its own.

  Both directions throw util::SerializationFailure.
*/
struct DecodedSnapshot {
  manager::v1::SnapshotHeader header;
  manager::v1::PartitionImage image;
};

std::shared_ptr<arrow::Buffer> EncodeSnapshot(const manager::v1::SnapshotHeader& header, const manager::v1::PartitionImage& image);

DecodedSnapshot DecodeSnapshot(const arrow::Buffer& buffer);

} // namespace checkpoint::worker
