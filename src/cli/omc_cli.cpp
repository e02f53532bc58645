#include <omc/cli/omc_cli.h>
#include <omc/config/config_helpers.h>

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace omc::cli {

using nlohmann::json;

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    auto v = config::toLower(config::trimmed(s));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

std::string snippet(const std::string& text, size_t max = 100) {
    if (text.size() <= max)
        return text;
    size_t cut = max;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut) + "...";
}

} // namespace

OmcCli::OmcCli(boost::asio::any_io_executor executor, ServiceFactory factory)
    : executor_(std::move(executor)), factory_(std::move(factory)) {
    if (!factory_)
        factory_ = &app::MemoryService::create;
    app_ = std::make_unique<CLI::App>("Ontological memory core", "omc");
    app_->require_subcommand(1);

    app_->add_option("--host", host_, "Backing store host (overrides HELIX_HOST)");
    app_->add_option("--port", port_, "Backing store port (overrides HELIX_PORT)");
    app_->add_option("--log-level", logLevel_, "trace, debug, info, warn, error or off");
    app_->add_option("--log-file", logFile_, "Also write logs to this file");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    registerCommands();
}

OmcCli::~OmcCli() = default;

void OmcCli::registerCommands() {
    health_ = app_->add_subcommand("health", "Check that the backing store answers");

    add_ = app_->add_subcommand("add", "Extract and store memories from a message");
    add_->add_option("message", text_, "Text to remember")->required();
    add_->add_option("-u,--user", userId_, "Owning user id")->required();
    add_->add_option("--agent", agentId_, "Agent that produced the message");

    search_ = app_->add_subcommand("search", "Search memories");
    search_->add_option("query", text_, "Search query")->required();
    search_->add_option("-u,--user", userId_, "Restrict to this user");
    search_->add_option("-l,--limit", limit_, "Maximum results");
    search_->add_option("-m,--mode", mode_, "recent, contextual, deep or full");
    search_->add_option("--concept", conceptType_, "Only memories linked to this concept");
    search_->add_option("--tag", tags_, "Extra tags to score against");

    chain_ = app_->add_subcommand("chain", "Follow reasoning chains from matching memories");
    chain_->add_option("query", text_, "Search query")->required();
    chain_->add_option("-u,--user", userId_, "Restrict seeds to this user");
    chain_->add_option("-m,--mode", chainMode_, "causal, forward, both or deep")
        ->check(CLI::IsMember({"causal", "forward", "both", "deep"}, CLI::ignore_case));
    chain_->add_option("--max-depth", maxDepth_, "Maximum chain depth");
    chain_->add_option("-l,--limit", limit_, "Number of seed memories");

    delete_ = app_->add_subcommand("delete", "Delete a memory");
    delete_->add_option("memory_id", memoryId_, "Memory id")->required();
    delete_->add_option("-s,--strategy", strategy_, "soft, hard or cascade")
        ->check(CLI::IsMember({"soft", "hard", "cascade"}, CLI::ignore_case));
    delete_->add_option("--by", actor_, "Who is deleting");
    delete_->add_option("--reason", reason_, "Why");

    undelete_ = app_->add_subcommand("undelete", "Restore a soft-deleted memory");
    undelete_->add_option("memory_id", memoryId_, "Memory id")->required();
    undelete_->add_option("--by", actor_, "Who is restoring");

    cleanup_ = app_->add_subcommand("cleanup", "Remove orphaned entities and edges");
    cleanup_->add_flag("--dry-run", dryRun_, "Only count orphans");

    stats_ = app_->add_subcommand("stats", "Storage, graph and growth statistics");
}

void OmcCli::configureLogging() {
    std::string level = logLevel_;
    if (level.empty()) {
        if (const char* env = std::getenv("OMC_LOG_LEVEL"); env && *env)
            level = env;
    }

    if (!logFile_.empty()) {
        try {
            auto logger = spdlog::basic_logger_mt("omc", logFile_);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            fmt::print(stderr, "Cannot open log file {}: {}\n", logFile_, e.what());
        }
    }

    auto lvl = level.empty() ? std::optional(spdlog::level::warn) : parseLevel(level);
    if (!lvl) {
        fmt::print(stderr, "Unknown log level '{}', using warn\n", level);
        lvl = spdlog::level::warn;
    }
    spdlog::set_level(*lvl);
}

int OmcCli::printResult(const json& payload, const std::string& text) {
    if (jsonOutput_)
        fmt::print("{}\n", payload.dump(2));
    else
        fmt::print("{}", text);
    return kExitOk;
}

int OmcCli::printError(const Error& error) {
    if (jsonOutput_) {
        fmt::print("{}\n", json{{"error", error.message},
                                {"code", errorToString(error.code)}}
                               .dump(2));
    } else {
        fmt::print(stderr, "Error: {}\n", error.message);
    }
    return error.code == ErrorCode::ConfigurationError ? kExitConfigError : kExitFailure;
}

int OmcCli::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        return app_->exit(e);
    } catch (const CLI::CallForAllHelp& e) {
        return app_->exit(e);
    } catch (const CLI::ParseError& e) {
        app_->exit(e);
        return kExitConfigError;
    }

    configureLogging();

    auto cfg = config::OmcConfig::fromEnvironment();
    if (host_)
        cfg.store.host = *host_;
    if (port_)
        cfg.store.port = *port_;

    auto service = factory_(cfg, executor_);
    if (!service) {
        auto err = service.error();
        if (err.code == ErrorCode::InvalidArgument)
            err.code = ErrorCode::ConfigurationError;
        return printError(err);
    }
    return dispatch(*service.value());
}

int OmcCli::dispatch(app::MemoryService& service) {
    if (health_->parsed()) {
        const bool ok = service.healthCheck();
        printResult(json{{"healthy", ok}, {"store", service.config().store.baseUrl()}},
                    fmt::format("store {} is {}\n", service.config().store.baseUrl(),
                                ok ? "reachable" : "unreachable"));
        return ok ? kExitOk : kExitFailure;
    }

    if (add_->parsed()) {
        if (auto init = service.initialize(); !init)
            spdlog::warn("Continuing without ontology: {}", init.error().message);
        std::optional<std::string> agent;
        if (!agentId_.empty())
            agent = agentId_;
        auto res = service.add(text_, userId_, agent);
        if (!res)
            return printError(res.error());
        const auto& r = res.value();
        std::string text = fmt::format("added {} memories, skipped {}, {} chunks, {} relations\n",
                                       r.memories_added, r.skipped_duplicates, r.chunks_created,
                                       r.relations);
        for (const auto& id : r.memory_ids)
            text += fmt::format("  {}\n", id);
        return printResult(json(r), text);
    }

    if (search_->parsed()) {
        if (conceptType_ || !tags_.empty()) {
            auto res = service.searchByConcept(text_, userId_, conceptType_, tags_, mode_, limit_);
            if (!res)
                return printError(res.error());
            json payload = json::array();
            std::string text;
            for (const auto& r : res.value()) {
                payload.push_back(r);
                text += fmt::format("{:.3f}  {}  {}\n", r.final_score, r.memory_id,
                                    snippet(r.content));
            }
            return printResult(payload, text.empty() ? "no results\n" : text);
        }
        auto res = service.search(text_, userId_, limit_, mode_);
        if (!res)
            return printError(res.error());
        json payload = json::array();
        std::string text;
        for (const auto& r : res.value()) {
            payload.push_back(r);
            text += fmt::format("{:.3f}  {}  [{}]  {}\n", r.combined_score, r.memory_id,
                                search::toString(r.source), snippet(r.content));
        }
        return printResult(payload, text.empty() ? "no results\n" : text);
    }

    if (chain_->parsed()) {
        auto res = service.searchReasoningChain(text_, userId_, chainMode_, maxDepth_,
                                                limit_.value_or(5));
        if (!res)
            return printError(res.error());
        const auto trails = res.value().reasoningTrails();
        return printResult(json(res.value()), trails.empty() ? "no chains\n" : trails);
    }

    if (delete_->parsed()) {
        auto strategy = evolution::parseDeletionStrategy(strategy_);
        if (!strategy)
            return printError(Error{ErrorCode::InvalidArgument, "Unknown strategy " + strategy_});
        auto res = service.remove(memoryId_, *strategy, actor_, reason_);
        if (!res)
            return printError(res.error());
        const auto& r = res.value();
        return printResult(json{{"memory_id", r.memory_id},
                                {"strategy", evolution::toString(r.strategy)},
                                {"success", r.success},
                                {"deleted_by", r.deleted_by},
                                {"deleted_at", r.deleted_at},
                                {"edges_affected", r.edges_affected}},
                           fmt::format("{} deleted ({}), {} edges affected\n", r.memory_id,
                                       evolution::toString(r.strategy), r.edges_affected));
    }

    if (undelete_->parsed()) {
        auto res = service.undelete(memoryId_, actor_);
        if (!res)
            return printError(res.error());
        const auto& r = res.value();
        return printResult(json{{"memory_id", r.memory_id},
                                {"success", r.success},
                                {"restored_by", r.restored_by},
                                {"restored_at", r.restored_at}},
                           fmt::format("{} restored\n", r.memory_id));
    }

    if (cleanup_->parsed()) {
        auto res = service.cleanupOrphans(dryRun_);
        if (!res)
            return printError(res.error());
        const auto& s = res.value();
        return printResult(json{{"orphaned_entities", s.orphaned_entities},
                                {"orphaned_edges", s.orphaned_edges},
                                {"deleted_entities", s.deleted_entities},
                                {"deleted_edges", s.deleted_edges},
                                {"dry_run", s.dry_run}},
                           fmt::format("{} orphaned entities, {} orphaned edges; deleted {} / {}{}\n",
                                       s.orphaned_entities, s.orphaned_edges, s.deleted_entities,
                                       s.deleted_edges, s.dry_run ? " (dry run)" : ""));
    }

    if (stats_->parsed()) {
        auto res = service.analytics();
        if (!res)
            return printError(res.error());
        const auto& s = res.value();
        std::string text = fmt::format(
            "memories: {} ({:.2f} MB, avg {:.0f} bytes)\nnodes: {}\ngrowth: {:.1f}/day ({})\n",
            s.storage.total_memories, s.storage.total_size_mb, s.storage.avg_memory_size,
            s.graph.total_nodes, s.growth.memories_per_day, s.growth.trend);
        for (const auto& [type, n] : s.categories)
            text += fmt::format("  {}: {}\n", type, n);
        return printResult(json(s), text);
    }

    return kExitConfigError;
}

} // namespace omc::cli
