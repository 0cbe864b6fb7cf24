#pragma once

#include <stdexcept>
#include <string>

namespace checkpoint::util {

/*
  Checkpoint error hierarchy. grpc::ToStatus maps each type to a status
  code; anything outside it becomes INTERNAL.

  Liveness loss and stalled epochs are not errors: they surface as
  state transitions, logs and metrics.
*/
class CheckpointError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFound : public CheckpointError {
 public:
  using CheckpointError::CheckpointError;
};

class AlreadyExists : public CheckpointError {
 public:
  using CheckpointError::CheckpointError;
};

// Request is well formed but arrives in the wrong mode or epoch state.
class InvalidState : public CheckpointError {
 public:
  using CheckpointError::CheckpointError;
};

// Worker could not capture or encode its own state. Fatal to the worker.
class SerializationFailure : public CheckpointError {
 public:
  using CheckpointError::CheckpointError;
};

// Retryable; the snapshot engine backs off and tries again.
class StorageWriteFailure : public CheckpointError {
 public:
  using CheckpointError::CheckpointError;
};

// No usable recovery point exists. Fatal at startup.
class RecoveryInconsistency : public CheckpointError {
 public:
  using CheckpointError::CheckpointError;
};

} // namespace checkpoint::util
