#pragma once
#include <atomic>
#include <memory>
#include <stdexcept>

namespace recsyn {

// Thrown by CancellationToken::throw_if_cancellation_requested; unwinds the whole analysis.
struct operation_canceled : std::runtime_error {
    operation_canceled() : std::runtime_error("operation canceled") {}
};

class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    bool is_cancellation_requested() const { return flag_ && flag_->load(std::memory_order_relaxed); }
    void throw_if_cancellation_requested() const { if(is_cancellation_requested()) throw operation_canceled(); }

private:
    std::shared_ptr<const std::atomic<bool>> flag_; // null: never canceled
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    CancellationToken token() const { return CancellationToken(flag_); }
    void cancel() { flag_->store(true, std::memory_order_relaxed); }
    bool is_cancellation_requested() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace recsyn
