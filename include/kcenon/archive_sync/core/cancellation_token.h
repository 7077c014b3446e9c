/**
 * @file cancellation_token.h
 * @brief Run-level cancellation signal
 */

#ifndef KCENON_ARCHIVE_SYNC_CORE_CANCELLATION_TOKEN_H
#define KCENON_ARCHIVE_SYNC_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace kcenon::archive_sync {

/**
 * @brief Shared cancellation flag
 *
 * Copies share the same underlying flag, so a token handed to a running
 * coordinator can be cancelled from any thread.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_CORE_CANCELLATION_TOKEN_H
