/**
 * @file Cancel.hpp
 * @brief Cooperative cancellation and deadlines for long alignments
 */

#ifndef TREEMERGE_CANCEL_HPP
#define TREEMERGE_CANCEL_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

namespace treemerge {

/**
 * @brief Flag another thread can raise to abort a running diff or merge
 */
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Per-call resource budget checked inside alignment loops
 *
 * Built once at the start of a diff or merge; the deadline is measured from
 * construction.
 */
class Budget {
public:
    Budget() = default;
    Budget(std::shared_ptr<const CancelToken> cancel,
           std::chrono::milliseconds deadline,
           std::size_t max_cells);

    /**
     * @brief Abort if cancelled or past the deadline
     * @throws AlignmentCancelled
     */
    void check() const;

    /**
     * @brief Abort if an alignment table of `cells` entries exceeds the limit
     * @throws AlignmentCancelled
     */
    void check_cells(std::size_t cells) const;

    bool expired() const noexcept;

private:
    std::shared_ptr<const CancelToken> cancel_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::size_t max_cells_ = 0;
};

} // namespace treemerge

#endif // TREEMERGE_CANCEL_HPP
