#pragma once

#include <omc/chunking/pipeline_events.h>
#include <omc/store/store_client.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace omc::chunking {

/**
 * @brief Single consumer of ChunkCreated events that writes NEXT_CHUNK edges.
 *
 * Chunks are grouped by parent memory. Once every chunk of a memory has arrived they are sorted
 * by position and N-1 linkChunks edges are written in order. The grouping maps are owned by
 * the consumer; drain() serializes callers.
 */
class LinkBuilder {
public:
    struct Stats {
        size_t pending_memories = 0;
        size_t total_chunks_tracked = 0;
        uint64_t links_created = 0;
        uint64_t link_errors = 0;
    };

    LinkBuilder(std::shared_ptr<store::StoreClient> store,
                std::shared_ptr<EventChannel<ChunkCreated>> channel, EventSink sink = {});

    // Consume everything queued; returns the memories whose chains completed
    std::vector<LinkingComplete> drain();

    // Completion record for a memory finished by any drain() call, removed on read
    std::optional<LinkingComplete> takeCompleted(const std::string& memoryId);

    // Drop a partially received memory (some chunks failed to persist)
    void abandon(const std::string& memoryId);

    Stats stats() const;

private:
    std::optional<LinkingComplete> onChunkCreated(ChunkCreated event);
    LinkingComplete buildLinks(const std::string& memoryId, std::vector<ChunkCreated> chunks);

    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<EventChannel<ChunkCreated>> channel_;
    EventSink sink_;

    mutable std::mutex consumerMutex_;
    std::unordered_map<std::string, std::vector<ChunkCreated>> chunksByMemory_;
    std::unordered_map<std::string, size_t> expectedChunks_;
    std::unordered_map<std::string, LinkingComplete> completed_;
    uint64_t linksCreated_ = 0;
    uint64_t linkErrors_ = 0;
};

} // namespace omc::chunking
