#pragma once

// =============================================================================
// Flamingo - Cancellation Token
// =============================================================================
//
// Cooperative cancellation shared between the caller and a running search.
// Copies share one flag. The optimizer checks it between submissions; the
// command runner uses it to stop waiting for a child once the grace period
// has passed.
//

#include <atomic>
#include <memory>

namespace flamingo {
namespace tuner {

class CancellationToken {
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    [[nodiscard]] bool cancelled() const { return flag_->load(std::memory_order_acquire); }

    /// Raw flag, for use from a signal handler (lock-free store only)
    [[nodiscard]] std::atomic<bool>* flag() const { return flag_.get(); }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace tuner
}  // namespace flamingo
