#pragma once

#include <omc/chunking/link_builder.h>
#include <omc/chunking/pipeline_events.h>
#include <omc/chunking/text_splitter.h>
#include <omc/embedding/embedding_generator.h>
#include <omc/resolution/id_resolver.h>
#include <omc/store/store_client.h>

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <stop_token>
#include <string>

namespace omc::chunking {

enum class PipelineStage { Resolving, Splitting, CreatingChunks, Linking, Completed, Failed };

const char* toString(PipelineStage stage);

struct ChunkingOutcome {
    std::string memory_id;
    PipelineStage stage = PipelineStage::Resolving;
    size_t chunks_created = 0;
    size_t chunks_failed = 0;
    size_t links_created = 0;
    size_t chains_created = 0;
    uint64_t duration_ms = 0;
};

/**
 * @brief Write pipeline for long memories: resolve, split, create chunks, link.
 *
 * Chunks are persisted concurrently on the executor. Each persisted chunk is pushed to the
 * link channel; the LinkBuilder turns complete groups into a NEXT_CHUNK chain. Event order per
 * memory: ChunkingStarted, ChunkCreated x N, LinkCreated x N-1, LinkingComplete,
 * ChunkingComplete. Partial chunk failures still complete with the failures counted; no links
 * are written for a memory with missing chunks.
 */
class ChunkingService {
public:
    struct Config {
        size_t threshold = 1000;
        SplitStrategy strategy = SplitStrategy::Sentence;
        SentenceSplitter::Config splitter;
        bool embedChunks = false;
    };

    ChunkingService(std::shared_ptr<store::StoreClient> store,
                    std::shared_ptr<resolution::IdResolver> resolver,
                    boost::asio::any_io_executor executor, Config config,
                    std::shared_ptr<embedding::EmbeddingGenerator> embedder = nullptr);

    bool needsChunking(std::string_view content) const;

    Result<ChunkingOutcome> process(const MemoryId& memoryId, const std::string& content,
                                    std::stop_token stop = {});

    // Register an observer; replaces any previous one. Not safe to call during process().
    void setEventSink(EventSink sink);

    LinkBuilder::Stats linkStats() const { return linkBuilder_->stats(); }

private:
    Result<ChunkCreated> persistChunk(const MemoryId& memoryId, const InternalId& parentInternalId,
                                      const TextChunk& chunk, size_t position, size_t total,
                                      const std::string& correlationId);
    void publish(const PipelineEvent& event);

    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<resolution::IdResolver> resolver_;
    boost::asio::any_io_executor executor_;
    Config config_;
    std::shared_ptr<embedding::EmbeddingGenerator> embedder_;
    std::unique_ptr<ITextSplitter> splitter_;

    std::shared_ptr<EventChannel<ChunkCreated>> channel_;
    std::shared_ptr<EventSink> sink_;
    std::unique_ptr<LinkBuilder> linkBuilder_;
};

} // namespace omc::chunking
