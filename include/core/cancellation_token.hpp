#pragma once

#include <atomic>
#include <memory>

/**
 * @brief Shared cooperative cancellation flag.
 *
 * Copies share the same flag. Jobs check it between files and
 * ExternalProcess kills the running child when it flips.
 */
class CancellationToken
{
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    bool isCancelled() const noexcept { return flag_->load(); }
    void reset() noexcept { flag_->store(false); }

    // Raw flag for signal handlers, valid while a copy of the token lives
    std::atomic<bool> *flag() const noexcept { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
