#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "localmind_core/errors.hpp"

namespace localmind_core {

// Shared flag checked at every orchestrator state transition and handed to
// tools. Copies observe the same flag. A child token is cancelled when its
// parent is, but cancelling the child leaves the parent untouched.
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void cancel() const { state_->flag.store(true); }

  bool is_cancelled() const {
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
      if (s->flag.load()) {
        return true;
      }
    }
    return false;
  }

  void throw_if_cancelled(const std::string& where) const {
    if (is_cancelled()) {
      throw CancelledError("Cancelled during " + where);
    }
  }

  CancellationToken child() const {
    CancellationToken token;
    token.state_->parent = state_;
    return token;
  }

 private:
  struct State {
    std::atomic<bool> flag{false};
    std::shared_ptr<const State> parent;
  };

  std::shared_ptr<State> state_;
};

}  // namespace localmind_core
