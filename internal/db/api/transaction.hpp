#pragma once

#include <stdexcept>
#include <string>

namespace checkpoint::db {

/*
  Unit of work against the manifest store.

  A transaction starts active and ends exactly once, by Commit() or
  Rollback(). Writes are invisible to other transactions until Commit().
  Destroying an active transaction rolls it back.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  bool Active() const {
    return state_ == State::kActive;
  }
  bool Committed() const {
    return state_ == State::kCommitted;
  }

 protected:
  enum class State {
    kActive,
    kCommitted,
    kRolledBack,
  };

  void RequireActive(const char* operation) const {
    if (state_ != State::kActive) {
      throw std::logic_error(std::string(operation) + " on a finished manifest transaction");
    }
  }

  State state_ = State::kActive;
};

} // namespace checkpoint::db
