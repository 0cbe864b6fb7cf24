#include "internal/worker/snapshot_reporter.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkpoint::worker {

using namespace checkpoint::manager::v1;

SnapshotReporter::SnapshotReporter(std::shared_ptr<CoordinatorLink> link, util::RetryPolicy retry) : link_(std::move(link)), retry_(retry) {
  if (!link_) {
    throw std::invalid_argument("snapshot reporter requires a coordinator link");
  }
}

SnapshotReporter::~SnapshotReporter() {
  Stop();
}

void SnapshotReporter::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&SnapshotReporter::Run, this);
}

void SnapshotReporter::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void SnapshotReporter::Enqueue(const SnapshotRecord& record) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(record);
  }
  cv_.notify_all();
}

size_t SnapshotReporter::Backlog() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void SnapshotReporter::Run() {
  while (true) {
    SnapshotRecord record;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
      if (stopping_) break;
      record = std::move(queue_.front());
      queue_.pop_front();
    }

    if (Deliver(record)) {
      ++delivered_;
    }
  }
}

bool SnapshotReporter::Deliver(const SnapshotRecord& record) {
  const bool coordinated = record.strategy() == STRATEGY_COORDINATED;

  for (uint32_t attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
    auto status = coordinated ? link_->AckSnapshot(record.generation(), record) : link_->ReportLocalSnapshot(record);
    if (status.ok()) return true;

    CHECKPOINT_LOG_WARN(coordinated ? "snapshot ack failed" : "local snapshot report failed",
                        {observability::StringField("worker_id", record.worker_id()),
                         observability::IntField("generation", static_cast<int64_t>(record.generation())),
                         observability::IntField("attempt", attempt), observability::StringField("error", status.ToString())});
    if (attempt == retry_.max_attempts) break;

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, util::BackoffFor(retry_, attempt), [&] { return stopping_; })) break;
  }

  // Local reports are advisory; the blob itself is already durable.
  CHECKPOINT_LOG_WARN(coordinated ? "giving up on snapshot ack, epoch waits for liveness" : "giving up on local snapshot report",
                      {observability::StringField("worker_id", record.worker_id()),
                       observability::IntField("generation", static_cast<int64_t>(record.generation()))});
  return false;
}

} // namespace checkpoint::worker
