#include <omc/config/config_helpers.h>
#include <omc/search/chain_search.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace omc::search {

namespace {

const std::vector<std::string> kAllRelations{"IMPLIES", "BECAUSE", "CONTRADICTS", "SUPPORTS",
                                             "REFUTES"};

// Cut at `maxBytes` without splitting a UTF-8 sequence
std::string preview(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes)
        return text;
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut) + "...";
}

} // namespace

const char* toString(ChainDirection direction) {
    switch (direction) {
        case ChainDirection::Forward:
            return "forward";
        case ChainDirection::Backward:
            return "backward";
        case ChainDirection::Both:
            return "both";
    }
    return "both";
}

MemoryChainConfig MemoryChainConfig::causalOnly() {
    MemoryChainConfig c;
    c.direction = ChainDirection::Backward;
    c.relation_types = {"BECAUSE"};
    c.include_contradictions = false;
    return c;
}

MemoryChainConfig MemoryChainConfig::implicationsOnly() {
    MemoryChainConfig c;
    c.direction = ChainDirection::Forward;
    c.relation_types = {"IMPLIES"};
    c.include_contradictions = false;
    return c;
}

MemoryChainConfig MemoryChainConfig::deepContext() {
    MemoryChainConfig c;
    c.max_depth = 7;
    c.relation_types = kAllRelations;
    c.min_confidence = 0.3;
    return c;
}

MemoryChainConfig MemoryChainConfig::fromChainMode(std::string_view mode) {
    auto name = config::toLower(config::trimmed(mode));
    if (name == "causal")
        return causalOnly();
    if (name == "forward")
        return implicationsOnly();
    if (name == "deep")
        return deepContext();
    return MemoryChainConfig{};
}

bool MemoryChainConfig::allows(const std::string& relationType) const {
    if (relationType == "CONTRADICTS" && !include_contradictions)
        return false;
    return std::find(relation_types.begin(), relation_types.end(), relationType) !=
           relation_types.end();
}

void MemoryChain::addNode(ChainNode node) {
    total_depth = std::max(total_depth, node.depth);
    nodes.push_back(std::move(node));
}

std::string MemoryChain::reasoningTrail() const {
    std::string trail;
    for (const auto& node : nodes) {
        trail += fmt::format("[{}] {} -> {}\n", node.depth, node.relation_type.value_or("ROOT"),
                             preview(node.content, 80));
    }
    return trail;
}

ChainSearchResult ChainSearchResult::build(std::string query, std::vector<MemoryChain> chains) {
    ChainSearchResult r;
    r.query = std::move(query);
    r.chains = std::move(chains);
    r.total_chains = r.chains.size();
    std::unordered_set<std::string> seen;
    for (const auto& chain : r.chains) {
        r.deepest_chain = std::max(r.deepest_chain, chain.total_depth);
        for (const auto& node : chain.nodes) {
            if (seen.insert(node.memory_id).second)
                r.memories.push_back(node);
        }
    }
    r.total_memories = seen.size();
    return r;
}

std::string ChainSearchResult::reasoningTrails() const {
    std::string out;
    for (size_t i = 0; i < chains.size(); ++i) {
        out += fmt::format("=== Chain {} (Type: {}) ===\n", i + 1, chains[i].chain_type);
        out += chains[i].reasoningTrail();
        if (i + 1 < chains.size())
            out += '\n';
    }
    return out;
}

std::vector<std::string> ChainSearch::connectionKeys(const std::string& relationType,
                                                     ChainDirection direction) {
    const auto base = config::toLower(relationType);
    std::string forward = base + "_out";
    std::string backward = base + "_in";
    // BECAUSE edges point from effect to cause
    if (base == "because")
        std::swap(forward, backward);

    switch (direction) {
        case ChainDirection::Forward:
            return {forward};
        case ChainDirection::Backward:
            return {backward};
        case ChainDirection::Both:
            return {base + "_out", base + "_in"};
    }
    return {};
}

ChainSearch::ChainSearch(std::shared_ptr<store::StoreClient> store) : store_(std::move(store)) {}

void ChainSearch::expand(MemoryChain& chain, const MemoryId& nodeId, size_t depth,
                         const MemoryChainConfig& config,
                         std::unordered_set<std::string>& visited) {
    if (depth > config.max_depth)
        return;

    auto conns = store_->executeAs<store::LogicalConnections>("getMemoryLogicalConnections",
                                                              {{"memory_id", nodeId}});
    if (!conns) {
        if (conns.error().code != ErrorCode::NotFound)
            spdlog::warn("Chain expansion from {} failed: {}", nodeId, conns.error().message);
        return;
    }

    const auto now = std::chrono::system_clock::now();
    for (const auto& relation : kAllRelations) {
        if (!config.allows(relation))
            continue;
        for (const auto& key : connectionKeys(relation, config.direction)) {
            for (const auto& n : conns.value().get(key)) {
                const auto& m = n.memory;
                if (m.memory_id.empty() || !m.isActive(now))
                    continue;
                if (n.strength / 100.0 < config.min_confidence)
                    continue;
                if (!visited.insert(m.memory_id).second)
                    continue;

                ChainNode node;
                node.memory_id = m.memory_id;
                node.content = m.content;
                if (!m.memory_type.empty())
                    node.memory_type = m.memory_type;
                node.depth = depth;
                node.relation_type = relation;
                chain.addNode(std::move(node));

                expand(chain, m.memory_id, depth + 1, config, visited);
            }
        }
    }
}

std::optional<MemoryChain> ChainSearch::buildChain(const store::MemoryRecord& seed,
                                                   const MemoryChainConfig& config) {
    MemoryChain chain;
    chain.seed_memory_id = seed.memory_id;

    ChainNode root;
    root.memory_id = seed.memory_id;
    root.content = seed.content;
    if (!seed.memory_type.empty())
        root.memory_type = seed.memory_type;
    chain.addNode(std::move(root));

    std::unordered_set<std::string> visited{seed.memory_id};
    expand(chain, seed.memory_id, 1, config, visited);

    if (chain.nodes.size() <= 1)
        return std::nullopt;
    return chain;
}

ChainSearchResult ChainSearch::searchFromSeeds(const std::string& query,
                                               const std::vector<store::MemoryRecord>& seeds,
                                               const MemoryChainConfig& config) {
    std::vector<MemoryChain> chains;
    for (const auto& seed : seeds) {
        if (auto chain = buildChain(seed, config))
            chains.push_back(std::move(*chain));
    }
    std::stable_sort(chains.begin(), chains.end(), [](const auto& a, const auto& b) {
        if (a.nodes.size() != b.nodes.size())
            return a.nodes.size() > b.nodes.size();
        return a.total_depth > b.total_depth;
    });

    auto result = ChainSearchResult::build(query, std::move(chains));
    spdlog::info("Chain search complete: {} chains, {} total memories, max depth {}",
                 result.total_chains, result.total_memories, result.deepest_chain);
    return result;
}

Result<ChainSearchResult> ChainSearch::search(const std::string& query,
                                              std::span<const float> embedding,
                                              const std::optional<std::string>& userId,
                                              size_t limit, const MemoryChainConfig& config) {
    spdlog::info("Chain search: '{}' (limit={}, direction={})", preview(query, 50), limit,
                 toString(config.direction));

    auto response = store_->executeAs<store::VectorSearchResponse>(
        "smartVectorSearchWithChunks",
        {{"query_vector", std::vector<float>(embedding.begin(), embedding.end())},
         {"limit", limit}});
    if (!response) {
        if (response.error().code == ErrorCode::NotFound)
            return ChainSearchResult::build(query, {});
        return Error{ErrorCode::DatabaseError, "Vector search failed: " + response.error().message};
    }

    const auto now = std::chrono::system_clock::now();
    std::vector<store::MemoryRecord> seeds;
    for (const auto& hit : response.value().merged()) {
        if (userId && hit.memory.user_id != *userId)
            continue;
        if (!hit.memory.isActive(now))
            continue;
        seeds.push_back(hit.memory);
        if (seeds.size() >= limit)
            break;
    }
    if (seeds.empty()) {
        spdlog::warn("No seeds found for query: {}", preview(query, 50));
        return ChainSearchResult::build(query, {});
    }
    spdlog::info("Found {} seed memories", seeds.size());
    return searchFromSeeds(query, seeds, config);
}

} // namespace omc::search
