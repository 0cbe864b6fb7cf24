#include "internal/worker/snapshot_engine.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/snapshot_codec.hpp"

namespace checkpoint::worker {

using namespace checkpoint::manager::v1;

namespace {

struct PendingGuard {
  explicit PendingGuard(std::atomic<size_t>& counter) : counter_(counter) {
    ++counter_;
  }
  ~PendingGuard() {
    --counter_;
  }

  std::atomic<size_t>& counter_;
};

} // namespace

SnapshotEngine::SnapshotEngine(std::string worker_id, std::shared_ptr<SnapshotSource> source, storage::SnapshotStorePtr store,
                               util::RetryPolicy retry, uint64_t next_sequence)
    : worker_id_(std::move(worker_id)), source_(std::move(source)), store_(std::move(store)), retry_(retry), next_sequence_(next_sequence) {
  storage::common::ValidateWorkerId(worker_id_);
  if (!source_ || !store_) {
    throw std::invalid_argument("snapshot engine requires a state source and a snapshot store");
  }
  if (retry_.max_attempts == 0) {
    throw std::invalid_argument("snapshot engine requires at least one write attempt");
  }
}

SnapshotEngine::~SnapshotEngine() {
  Stop();
}

void SnapshotEngine::SetCompletionSink(CompletionSink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
}

void SnapshotEngine::SetFatalHandler(FatalHandler handler) {
  std::lock_guard lock(mutex_);
  fatal_ = std::move(handler);
}

void SnapshotEngine::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&SnapshotEngine::Run, this);
}

void SnapshotEngine::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

uint64_t SnapshotEngine::ResumeSequence() {
  const auto highest = storage::HighestGeneration(*store_, storage::common::WorkerPrefix(STRATEGY_UNCOORDINATED, worker_id_));

  std::lock_guard lock(write_mutex_);
  if (highest + 1 > next_sequence_) next_sequence_ = highest + 1;
  return next_sequence_;
}

uint64_t SnapshotEngine::NextSequence() const {
  std::lock_guard lock(write_mutex_);
  return next_sequence_;
}

CapturedState SnapshotEngine::CaptureOrThrow() {
  CapturedState state;
  try {
    state = source_->Capture();
  } catch (const util::SerializationFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw util::SerializationFailure(std::string("state capture failed: ") + e.what());
  }
  if (!state.image) {
    throw util::SerializationFailure("state capture produced no image");
  }
  return state;
}

std::optional<SnapshotRecord> SnapshotEngine::Snapshot(const SnapshotTrigger& trigger) {
  PendingGuard guard(pending_);

  Job job{trigger, CaptureOrThrow()};
  return Write(job);
}

bool SnapshotEngine::Submit(const SnapshotTrigger& trigger) {
  if (trigger.kind == TRIGGER_COORDINATED_EPOCH) {
    std::lock_guard lock(mutex_);
    if (trigger.epoch <= last_epoch_) {
      CHECKPOINT_LOG_DEBUG("ignoring stale barrier",
                           {observability::IntField("epoch", static_cast<int64_t>(trigger.epoch)),
                            observability::IntField("last_epoch", static_cast<int64_t>(last_epoch_))});
      return false;
    }
    last_epoch_ = trigger.epoch;
  }

  ++pending_;
  Job job{trigger, {}};
  try {
    job.state = CaptureOrThrow();
  } catch (const util::SerializationFailure& e) {
    --pending_;
    FatalHandler fatal;
    {
      std::lock_guard lock(mutex_);
      fatal = fatal_;
    }
    CHECKPOINT_LOG_ERROR("snapshot capture failed", {observability::StringField("worker_id", worker_id_), observability::StringField("error", e.what())});
    if (fatal) fatal(e);
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(job));
  }
  // Backoff waits share cv_, so wake everyone.
  cv_.notify_all();
  return true;
}

void SnapshotEngine::Run() {
  while (true) {
    Job job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) break;
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    std::optional<SnapshotRecord> record;
    try {
      record = Write(job);
    } catch (const util::SerializationFailure& e) {
      --pending_;
      FatalHandler fatal;
      {
        std::lock_guard lock(mutex_);
        fatal = fatal_;
      }
      CHECKPOINT_LOG_ERROR("snapshot serialization failed", {observability::StringField("worker_id", worker_id_), observability::StringField("error", e.what())});
      if (fatal) fatal(e);
      continue;
    }
    --pending_;

    if (!record) continue;

    CompletionSink sink;
    {
      std::lock_guard lock(mutex_);
      sink = sink_;
    }
    if (sink) sink(*record);
  }
}

bool SnapshotEngine::PutWithRetry(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  for (uint32_t attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
    try {
      store_->Put(key, buffer);
      return true;
    } catch (const util::AlreadyExists&) {
      throw;
    } catch (const std::exception& e) {
      CHECKPOINT_LOG_WARN("snapshot write failed",
                          {observability::StringField("key", key), observability::IntField("attempt", attempt),
                           observability::StringField("error", e.what())});
    }
    if (attempt == retry_.max_attempts) break;

    // Wait out the backoff, but let Stop() cut it short.
    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, util::BackoffFor(retry_, attempt), [&] { return stopping_; })) break;
  }
  return false;
}

std::optional<SnapshotRecord> SnapshotEngine::Write(const Job& job) {
  std::lock_guard write_lock(write_mutex_);

  const bool     coordinated = job.trigger.kind == TRIGGER_COORDINATED_EPOCH;
  const auto     strategy    = coordinated ? STRATEGY_COORDINATED : STRATEGY_UNCOORDINATED;
  const uint64_t generation  = coordinated ? job.trigger.epoch : next_sequence_;
  const auto     started     = util::SteadyNow();

  observability::SpanScope span("checkpoint.snapshot.write");
  span.SetAttribute("worker_id", worker_id_);
  span.SetAttribute("generation", static_cast<std::int64_t>(generation));

  SnapshotHeader header;
  header.set_worker_id(worker_id_);
  header.set_strategy(strategy);
  header.set_generation(generation);
  *header.mutable_created_at() = util::ToProto(util::Now());
  for (const auto& offset : job.state.offsets) {
    *header.add_offsets() = offset;
  }

  auto       buffer   = EncodeSnapshot(header, *job.state.image);
  const auto key      = storage::common::SnapshotKey(strategy, worker_id_, generation);
  const auto checksum = util::Crc32c::Compute(buffer->data(), static_cast<size_t>(buffer->size()));

  bool written = false;
  try {
    written = PutWithRetry(key, buffer);
  } catch (const util::AlreadyExists& e) {
    // Generations are never rewritten; skip past it instead of retrying.
    if (!coordinated) next_sequence_ = generation + 1;
    observability::Metrics::Instance().RecordSnapshotFailure("key_exists");
    span.RecordException(e.what());
    CHECKPOINT_LOG_WARN("snapshot generation already stored, attempt abandoned",
                        {observability::StringField("worker_id", worker_id_), observability::StringField("key", key)});
    return std::nullopt;
  }

  if (!written) {
    observability::Metrics::Instance().RecordSnapshotFailure("storage_write");
    span.RecordException("write retries exhausted");
    CHECKPOINT_LOG_WARN("snapshot abandoned after retries, keeping previous baseline",
                        {observability::StringField("worker_id", worker_id_), observability::StringField("key", key),
                         observability::IntField("attempts", retry_.max_attempts)});
    return std::nullopt;
  }

  SnapshotRecord record;
  record.set_worker_id(worker_id_);
  record.set_strategy(strategy);
  record.set_generation(generation);
  *record.mutable_created_at() = header.created_at();
  record.set_storage_key(key);
  record.set_size_bytes(static_cast<uint64_t>(buffer->size()));
  record.set_checksum(checksum);
  *record.mutable_offsets() = header.offsets();

  if (!coordinated) next_sequence_ = generation + 1;

  const auto elapsed = util::ElapsedMillis(started, util::SteadyNow());
  observability::Metrics::Instance().ObserveSnapshotWrite(storage::common::StrategyDirectory(strategy), static_cast<double>(elapsed),
                                                         record.size_bytes());
  CHECKPOINT_LOG_INFO("snapshot durable",
                      {observability::StringField("worker_id", worker_id_), observability::StringField("key", key),
                       observability::IntField("bytes", static_cast<int64_t>(record.size_bytes())),
                       observability::DurationMsField("write", elapsed)});
  return record;
}

} // namespace checkpoint::worker
