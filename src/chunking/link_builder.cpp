#include <omc/chunking/link_builder.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace omc::chunking {

LinkBuilder::LinkBuilder(std::shared_ptr<store::StoreClient> store,
                         std::shared_ptr<EventChannel<ChunkCreated>> channel, EventSink sink)
    : store_(std::move(store)), channel_(std::move(channel)), sink_(std::move(sink)) {}

std::vector<LinkingComplete> LinkBuilder::drain() {
    std::lock_guard<std::mutex> lock(consumerMutex_);
    std::vector<LinkingComplete> completed;
    ChunkCreated event;
    while (channel_->try_pop(event)) {
        if (auto done = onChunkCreated(std::move(event))) {
            completed_[done->memory_id] = *done;
            completed.push_back(std::move(*done));
        }
    }
    return completed;
}

std::optional<LinkingComplete> LinkBuilder::takeCompleted(const std::string& memoryId) {
    std::lock_guard<std::mutex> lock(consumerMutex_);
    auto it = completed_.find(memoryId);
    if (it == completed_.end())
        return std::nullopt;
    auto done = std::move(it->second);
    completed_.erase(it);
    return done;
}

std::optional<LinkingComplete> LinkBuilder::onChunkCreated(ChunkCreated event) {
    const auto memoryId = event.parent_memory_id;
    const auto total = event.total_chunks;

    auto& expected = expectedChunks_[memoryId];
    expected = total;
    auto& bucket = chunksByMemory_[memoryId];
    bucket.push_back(std::move(event));

    if (bucket.size() < expected)
        return std::nullopt;

    auto chunks = std::move(bucket);
    chunksByMemory_.erase(memoryId);
    expectedChunks_.erase(memoryId);
    return buildLinks(memoryId, std::move(chunks));
}

LinkingComplete LinkBuilder::buildLinks(const std::string& memoryId,
                                        std::vector<ChunkCreated> chunks) {
    auto started = std::chrono::steady_clock::now();
    std::sort(chunks.begin(), chunks.end(),
              [](const ChunkCreated& a, const ChunkCreated& b) { return a.position < b.position; });

    LinkingComplete done;
    done.memory_id = memoryId;

    for (size_t i = 1; i < chunks.size(); ++i) {
        const auto& from = chunks[i - 1];
        const auto& to = chunks[i];
        auto res = store_->execute("linkChunks", {{"from_chunk_id", from.chunk_internal_id},
                                                  {"to_chunk_id", to.chunk_internal_id}});
        if (!res) {
            ++done.errors;
            ++linkErrors_;
            spdlog::warn("[LinkBuilder] Failed to link {} -> {}: {}", from.chunk_id, to.chunk_id,
                         res.error().message);
            continue;
        }
        ++done.edges_created;
        ++linksCreated_;
        if (sink_)
            sink_(LinkCreated{memoryId, from.chunk_id, to.chunk_id});
    }

    done.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started)
            .count());
    spdlog::debug("[LinkBuilder] {}: {} links, {} errors", memoryId, done.edges_created,
                  done.errors);
    if (sink_)
        sink_(done);
    return done;
}

void LinkBuilder::abandon(const std::string& memoryId) {
    std::lock_guard<std::mutex> lock(consumerMutex_);
    auto it = chunksByMemory_.find(memoryId);
    if (it != chunksByMemory_.end()) {
        spdlog::warn("[LinkBuilder] Abandoning {} with {}/{} chunks", memoryId, it->second.size(),
                     expectedChunks_[memoryId]);
        chunksByMemory_.erase(it);
    }
    expectedChunks_.erase(memoryId);
}

LinkBuilder::Stats LinkBuilder::stats() const {
    std::lock_guard<std::mutex> lock(consumerMutex_);
    Stats s;
    s.pending_memories = chunksByMemory_.size();
    for (const auto& [_, chunks] : chunksByMemory_)
        s.total_chunks_tracked += chunks.size();
    s.links_created = linksCreated_;
    s.link_errors = linkErrors_;
    return s;
}

} // namespace omc::chunking
