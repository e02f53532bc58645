#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <variant>

namespace omc::chunking {

struct ChunkingStarted {
    std::string memory_id;
    std::string internal_id;
    size_t content_length = 0;
    size_t estimated_chunks = 0;
    std::string strategy;
    std::string correlation_id;
};

struct ChunkCreated {
    std::string chunk_id;
    std::string chunk_internal_id;
    std::string parent_memory_id;
    std::string parent_internal_id;
    size_t position = 0;
    std::string content;
    size_t token_count = 0;
    size_t total_chunks = 0;
    std::string correlation_id;
};

struct ChunkingComplete {
    std::string memory_id;
    size_t chunks_created = 0;
    size_t links_created = 0;
    size_t chains_created = 0;
    uint64_t duration_ms = 0;
    bool success = false;
    std::string correlation_id;
};

struct ChunkingFailed {
    std::string memory_id;
    std::string stage;
    std::string error;
    std::string correlation_id;
};

struct LinkCreated {
    std::string parent_memory_id;
    std::string from_chunk_id;
    std::string to_chunk_id;
};

struct LinkingComplete {
    std::string memory_id;
    size_t edges_created = 0;
    size_t errors = 0;
    uint64_t duration_ms = 0;
};

using PipelineEvent = std::variant<ChunkingStarted, ChunkCreated, ChunkingComplete,
                                   ChunkingFailed, LinkCreated, LinkingComplete>;

/// Observer for pipeline events. Called from worker threads; must be thread-safe.
using EventSink = std::function<void(const PipelineEvent&)>;

/**
 * @brief Multi-producer queue drained by a single consumer.
 *
 * Mutex-guarded; unbounded so that producers on the pool never wait on the consumer.
 */
template <typename T> class EventChannel {
public:
    void push(T value) {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.push_back(std::move(value));
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return queue_.size();
    }

private:
    mutable std::mutex mu_;
    std::deque<T> queue_;
};

} // namespace omc::chunking
