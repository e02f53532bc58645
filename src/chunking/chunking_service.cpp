#include <omc/chunking/chunking_service.h>
#include <omc/core/executor.h>
#include <omc/core/ids.h>
#include <omc/core/time_utils.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <future>

namespace omc::chunking {

const char* toString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Resolving:
            return "resolving";
        case PipelineStage::Splitting:
            return "splitting";
        case PipelineStage::CreatingChunks:
            return "creating_chunks";
        case PipelineStage::Linking:
            return "linking";
        case PipelineStage::Completed:
            return "completed";
        case PipelineStage::Failed:
            return "failed";
    }
    return "unknown";
}

ChunkingService::ChunkingService(std::shared_ptr<store::StoreClient> store,
                                 std::shared_ptr<resolution::IdResolver> resolver,
                                 boost::asio::any_io_executor executor, Config config,
                                 std::shared_ptr<embedding::EmbeddingGenerator> embedder)
    : store_(std::move(store)), resolver_(std::move(resolver)), executor_(std::move(executor)),
      config_(config), embedder_(std::move(embedder)),
      splitter_(makeSplitter(config_.strategy, config_.splitter)),
      channel_(std::make_shared<EventChannel<ChunkCreated>>()),
      sink_(std::make_shared<EventSink>()) {
    auto sink = sink_;
    linkBuilder_ = std::make_unique<LinkBuilder>(store_, channel_, [sink](const PipelineEvent& e) {
        if (*sink)
            (*sink)(e);
    });
}

bool ChunkingService::needsChunking(std::string_view content) const {
    return chunking::needsChunking(content, config_.threshold);
}

void ChunkingService::setEventSink(EventSink sink) {
    *sink_ = std::move(sink);
}

void ChunkingService::publish(const PipelineEvent& event) {
    if (*sink_)
        (*sink_)(event);
}

Result<ChunkCreated> ChunkingService::persistChunk(const MemoryId& memoryId,
                                                   const InternalId& parentInternalId,
                                                   const TextChunk& chunk, size_t position,
                                                   size_t total,
                                                   const std::string& correlationId) {
    ChunkCreated event;
    event.chunk_id = core::makeChunkId(memoryId, position);
    event.parent_memory_id = memoryId;
    event.parent_internal_id = parentInternalId;
    event.position = position;
    event.content = chunk.text;
    event.token_count = chunk.token_count;
    event.total_chunks = total;
    event.correlation_id = correlationId;

    auto res = store_->execute("addMemoryChunk", {{"chunk_id", event.chunk_id},
                                                  {"parent_id", parentInternalId},
                                                  {"position", position},
                                                  {"content", chunk.text},
                                                  {"token_count", chunk.token_count},
                                                  {"created_at", core::nowTimestamp()}});
    if (!res)
        return res.error();

    event.chunk_internal_id = store::jsonString(store::unwrap(res.value(), "chunk"), "id");
    if (event.chunk_internal_id.empty()) {
        return Error{ErrorCode::MissingInternalId,
                     "addMemoryChunk returned no id for " + event.chunk_id};
    }

    if (config_.embedChunks && embedder_) {
        auto vec = embedder_->generate(chunk.text);
        if (vec) {
            auto emb = store_->execute("addChunkEmbedding",
                                       {{"chunk_id", event.chunk_internal_id},
                                        {"vector_data", vec.value()},
                                        {"embedding_model", embedder_->modelName()},
                                        {"created_at", core::nowTimestamp()}});
            if (!emb)
                spdlog::warn("[Chunking] Embedding for {} not stored: {}", event.chunk_id,
                             emb.error().message);
        } else {
            spdlog::warn("[Chunking] Embedding for {} failed: {}", event.chunk_id,
                         vec.error().message);
        }
    }
    return event;
}

Result<ChunkingOutcome> ChunkingService::process(const MemoryId& memoryId,
                                                 const std::string& content,
                                                 std::stop_token stop) {
    auto started = std::chrono::steady_clock::now();
    const auto correlationId = core::generateUUID();
    ChunkingOutcome outcome;
    outcome.memory_id = memoryId;

    auto fail = [&](PipelineStage stage, Error err) -> Result<ChunkingOutcome> {
        outcome.stage = PipelineStage::Failed;
        publish(ChunkingFailed{memoryId, toString(stage), err.message, correlationId});
        spdlog::error("[Chunking] {} failed at {}: {}", memoryId, toString(stage), err.message);
        return err;
    };
    auto cancelled = [&](PipelineStage stage) {
        return fail(stage, Error{ErrorCode::OperationCancelled, "chunking cancelled"});
    };

    // Resolving
    outcome.stage = PipelineStage::Resolving;
    if (stop.stop_requested())
        return cancelled(outcome.stage);
    auto internal = resolver_->resolve(memoryId);
    if (!internal) {
        auto err = internal.error();
        if (err.code == ErrorCode::NotFound)
            err = Error{ErrorCode::MissingInternalId, err.message};
        return fail(outcome.stage, err);
    }
    const auto parentInternalId = internal.value();

    // Splitting
    outcome.stage = PipelineStage::Splitting;
    if (stop.stop_requested())
        return cancelled(outcome.stage);
    auto split = splitter_->split(content);
    if (!split)
        return fail(outcome.stage, split.error());
    const auto& chunks = split.value();
    const size_t total = chunks.size();

    publish(ChunkingStarted{memoryId, parentInternalId, content.size(), total,
                            toString(splitter_->strategy()), correlationId});

    // CreatingChunks
    outcome.stage = PipelineStage::CreatingChunks;
    if (stop.stop_requested())
        return cancelled(outcome.stage);

    std::vector<std::future<Result<ChunkCreated>>> pending;
    pending.reserve(total);
    for (size_t pos = 0; pos < total; ++pos) {
        pending.push_back(core::submit(executor_, [this, memoryId, parentInternalId,
                                                   chunk = chunks[pos], pos, total,
                                                   correlationId]() {
            auto created =
                persistChunk(memoryId, parentInternalId, chunk, pos, total, correlationId);
            if (created) {
                channel_->push(created.value());
                publish(created.value());
            }
            return created;
        }));
    }
    for (auto& fut : pending) {
        auto created = fut.get();
        if (created) {
            ++outcome.chunks_created;
        } else {
            ++outcome.chunks_failed;
            spdlog::warn("[Chunking] Chunk of {} not created: {}", memoryId,
                         created.error().message);
        }
    }

    // Linking
    outcome.stage = PipelineStage::Linking;
    linkBuilder_->drain();
    if (auto done = linkBuilder_->takeCompleted(memoryId))
        outcome.links_created = done->edges_created;
    if (outcome.chunks_failed > 0)
        linkBuilder_->abandon(memoryId);
    outcome.chains_created = outcome.links_created > 0 ? 1 : 0;

    outcome.stage = PipelineStage::Completed;
    outcome.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started)
            .count());

    publish(ChunkingComplete{memoryId, outcome.chunks_created, outcome.links_created,
                             outcome.chains_created, outcome.duration_ms,
                             outcome.chunks_failed == 0, correlationId});
    spdlog::info("[Chunking] {}: {} chunks, {} links in {}ms", memoryId, outcome.chunks_created,
                 outcome.links_created, outcome.duration_ms);
    return outcome;
}

} // namespace omc::chunking
