#ifndef ADAPTIVE_CHUNK_CONTROLLER_H
#define ADAPTIVE_CHUNK_CONTROLLER_H

#include <chrono>
#include <cstddef>

// Range size of one download worker. Fast requests double it, slow ones halve
// it, always within [minBytes, maxBytes]. Owned by a single worker; not
// shared between threads.
class AdaptiveChunkController {
public:
    struct Limits {
        size_t minBytes = 256 * 1024;
        size_t maxBytes = 8 * 1024 * 1024;
        std::chrono::milliseconds fastThreshold{300};
        std::chrono::milliseconds slowThreshold{5000};
    };

    AdaptiveChunkController();
    explicit AdaptiveChunkController(Limits limits);

    size_t chunkSize() const { return chunk_size_; }

    // Returns the chunk size to use next
    size_t onRequestCompleted(std::chrono::milliseconds elapsed);

    void resetToMinimum() { chunk_size_ = limits_.minBytes; }

    const Limits& limits() const { return limits_; }

private:
    Limits limits_;
    size_t chunk_size_;
};

#endif // ADAPTIVE_CHUNK_CONTROLLER_H
