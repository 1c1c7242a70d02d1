#include "AdaptiveChunkController.hpp"

#include <algorithm>

AdaptiveChunkController::AdaptiveChunkController()
    : AdaptiveChunkController(Limits{}) {
}

AdaptiveChunkController::AdaptiveChunkController(Limits limits)
    : limits_(limits), chunk_size_(limits.minBytes) {
    if (limits_.maxBytes < limits_.minBytes) {
        limits_.maxBytes = limits_.minBytes;
    }
}

size_t AdaptiveChunkController::onRequestCompleted(std::chrono::milliseconds elapsed) {
    if (elapsed < limits_.fastThreshold) {
        chunk_size_ = std::min(chunk_size_ * 2, limits_.maxBytes);
    } else if (elapsed > limits_.slowThreshold) {
        chunk_size_ = std::max(chunk_size_ / 2, limits_.minBytes);
    }
    return chunk_size_;
}
