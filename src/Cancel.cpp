/**
 * @file Cancel.cpp
 * @brief Budget checks
 */

#include "treemerge/Cancel.hpp"
#include "treemerge/Errors.hpp"

#include <string>

namespace treemerge {

Budget::Budget(std::shared_ptr<const CancelToken> cancel,
               std::chrono::milliseconds deadline,
               std::size_t max_cells)
    : cancel_(std::move(cancel))
    , max_cells_(max_cells)
{
    if (deadline.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + deadline;
    }
}

bool Budget::expired() const noexcept {
    if (cancel_ && cancel_->cancelled()) return true;
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
}

void Budget::check() const {
    if (cancel_ && cancel_->cancelled()) {
        throw AlignmentCancelled("cancelled by caller");
    }
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
        throw AlignmentCancelled("deadline exceeded");
    }
}

void Budget::check_cells(std::size_t cells) const {
    if (max_cells_ > 0 && cells > max_cells_) {
        throw AlignmentCancelled("alignment table of " + std::to_string(cells) +
                                 " cells exceeds limit of " + std::to_string(max_cells_));
    }
}

} // namespace treemerge
