#include <gtest/gtest.h>

#include "../../common/fake_providers.h"
#include "../../common/fake_store.h"

#include <omc/cli/omc_cli.h>
#include <omc/core/executor.h>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

using namespace omc;
using omc::test::FakeEmbeddingProvider;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::makeGenerator;
using nlohmann::json;

class OmcCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        // keep stdout for command output
        static auto logger = spdlog::stderr_color_mt("omc_cli_test");
        spdlog::set_default_logger(logger);

        transport_ = std::make_shared<FakeStoreTransport>();
        transport_->setOntologyInitialized(true);
        embedder_ = std::make_shared<FakeEmbeddingProvider>();
    }

    cli::OmcCli::ServiceFactory factory() {
        return [this](const config::OmcConfig& cfg, boost::asio::any_io_executor executor)
                   -> Result<std::unique_ptr<app::MemoryService>> {
            ++created_;
            lastConfig_ = cfg;
            app::ServiceDependencies deps;
            deps.store = makeClient(transport_, 1);
            deps.embedder = makeGenerator(embedder_);
            deps.executor = std::move(executor);
            deps.config = cfg;
            return std::make_unique<app::MemoryService>(std::move(deps));
        };
    }

    int run(std::vector<std::string> args, cli::OmcCli::ServiceFactory f = {}) {
        args.insert(args.begin(), "omc");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());
        cli::OmcCli cli(pool_.get_executor(), f ? std::move(f) : factory());
        return cli.run(static_cast<int>(argv.size()), argv.data());
    }

    // Runs the command and returns its stdout
    std::string runCaptured(std::vector<std::string> args, int& code) {
        ::testing::internal::CaptureStdout();
        code = run(std::move(args));
        return ::testing::internal::GetCapturedStdout();
    }

    core::WorkerPool pool_{2};
    std::shared_ptr<FakeStoreTransport> transport_;
    std::shared_ptr<FakeEmbeddingProvider> embedder_;
    int created_ = 0;
    config::OmcConfig lastConfig_;
};

TEST_F(OmcCliTest, AddThenSearchAsJson) {
    int code = -1;
    auto out = runCaptured({"--json", "add", "I prefer Rust", "-u", "alice"}, code);
    ASSERT_EQ(code, cli::kExitOk) << out;
    auto added = json::parse(out);
    EXPECT_EQ(added["memories_added"], 1);
    ASSERT_EQ(added["memory_ids"].size(), 1u);
    const auto id = added["memory_ids"][0].get<std::string>();

    out = runCaptured({"--json", "search", "I prefer Rust", "-u", "alice", "-m", "full"}, code);
    ASSERT_EQ(code, cli::kExitOk) << out;
    auto results = json::parse(out);
    ASSERT_TRUE(results.is_array());
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0]["memory_id"], id);
    EXPECT_EQ(results[0]["source"], "vector");
}

TEST_F(OmcCliTest, PlainTextOutput) {
    int code = -1;
    auto out = runCaptured({"search", "anything", "-u", "nobody"}, code);
    EXPECT_EQ(code, cli::kExitOk);
    EXPECT_EQ(out, "no results\n");

    out = runCaptured({"health"}, code);
    EXPECT_EQ(code, cli::kExitOk);
    EXPECT_NE(out.find("reachable"), std::string::npos);
}

TEST_F(OmcCliTest, HostAndPortOverrideConfiguration) {
    EXPECT_EQ(run({"--host", "graph.internal", "--port", "7000", "stats"}), cli::kExitOk);
    EXPECT_EQ(created_, 1);
    EXPECT_EQ(lastConfig_.store.host, "graph.internal");
    EXPECT_EQ(lastConfig_.store.port, 7000u);
}

TEST_F(OmcCliTest, UsageErrorsExitWithTwo) {
    EXPECT_EQ(run({}), cli::kExitConfigError);
    EXPECT_EQ(run({"frobnicate"}), cli::kExitConfigError);
    EXPECT_EQ(run({"add", "no user given"}), cli::kExitConfigError);
    EXPECT_EQ(run({"chain", "why", "-m", "sideways"}), cli::kExitConfigError);
    EXPECT_EQ(run({"delete", "mem_1", "-s", "shred"}), cli::kExitConfigError);
    EXPECT_EQ(created_, 0);
}

TEST_F(OmcCliTest, ServiceConstructionFailure) {
    auto failing = [](const config::OmcConfig&, boost::asio::any_io_executor)
        -> Result<std::unique_ptr<app::MemoryService>> {
        return Error{ErrorCode::ConfigurationError, "HELIX_PORT is not a port"};
    };
    EXPECT_EQ(run({"stats"}, failing), cli::kExitConfigError);

    auto unreachable = [](const config::OmcConfig&, boost::asio::any_io_executor)
        -> Result<std::unique_ptr<app::MemoryService>> {
        return Error{ErrorCode::NetworkError, "connection refused"};
    };
    EXPECT_EQ(run({"stats"}, unreachable), cli::kExitFailure);
}

TEST_F(OmcCliTest, OperationFailuresExitWithOne) {
    EXPECT_EQ(run({"delete", "mem_missing"}), cli::kExitFailure);
    EXPECT_EQ(run({"undelete", "mem_missing"}), cli::kExitFailure);

    transport_->failQuery("health", Error{ErrorCode::NetworkError, "down"});
    EXPECT_EQ(run({"health"}), cli::kExitFailure);
}

TEST_F(OmcCliTest, DeleteRestoreAndCleanup) {
    int code = -1;
    auto out = runCaptured({"--json", "add", "Deploys happen on Fridays", "-u", "alice"}, code);
    ASSERT_EQ(code, cli::kExitOk);
    const auto id = json::parse(out)["memory_ids"][0].get<std::string>();

    out = runCaptured({"--json", "delete", id, "--reason", "stale"}, code);
    ASSERT_EQ(code, cli::kExitOk) << out;
    auto deleted = json::parse(out);
    EXPECT_EQ(deleted["strategy"], "soft");
    EXPECT_EQ(deleted["deleted_by"], "cli");
    EXPECT_TRUE((*transport_->memory(id))["is_deleted"].get<bool>());

    EXPECT_EQ(run({"undelete", id, "--by", "alice"}), cli::kExitOk);
    EXPECT_FALSE((*transport_->memory(id))["is_deleted"].get<bool>());

    out = runCaptured({"--json", "cleanup", "--dry-run"}, code);
    ASSERT_EQ(code, cli::kExitOk);
    EXPECT_TRUE(json::parse(out)["dry_run"].get<bool>());
}

TEST_F(OmcCliTest, ChainCommandPrintsTrails) {
    transport_->putMemory(omc::test::memoryRecord("mem_a", "Alice moved to Berlin"),
                          embedder_->embed("why did alice move").value());
    transport_->putMemory(omc::test::memoryRecord("mem_b", "Alice took a job in Berlin"));
    transport_->addEdge("BECAUSE", "mem_a", "mem_b", 90);

    int code = -1;
    auto out = runCaptured({"chain", "why did alice move", "-u", "alice", "-m", "causal"}, code);
    ASSERT_EQ(code, cli::kExitOk) << out;
    EXPECT_NE(out.find("[1] BECAUSE -> Alice took a job in Berlin"), std::string::npos);
}
