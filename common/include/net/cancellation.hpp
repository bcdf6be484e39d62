#pragma once

#include <atomic>
#include <memory>

namespace smsgw {

// Shared cancellation flag. Copies observe the same state, so the owner of a
// connection can abort work that was handed to another thread.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace smsgw
