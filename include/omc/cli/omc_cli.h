#pragma once

#include <omc/app/memory_service.h>
#include <omc/config/omc_config.h>

#include <CLI/CLI.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace omc::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitConfigError = 2;

/**
 * Operator command line: health, add, search, chain, delete, undelete, cleanup, stats.
 *
 * Exit codes: 0 on success, 1 when the operation fails, 2 on bad configuration or usage.
 */
class OmcCli {
public:
    using ServiceFactory = std::function<Result<std::unique_ptr<app::MemoryService>>(
        const config::OmcConfig&, boost::asio::any_io_executor)>;

    explicit OmcCli(boost::asio::any_io_executor executor, ServiceFactory factory = {});
    ~OmcCli();

    int run(int argc, char* argv[]);

private:
    void registerCommands();
    void configureLogging();
    int dispatch(app::MemoryService& service);

    int printResult(const nlohmann::json& payload, const std::string& text);
    int printError(const Error& error);

    boost::asio::any_io_executor executor_;
    ServiceFactory factory_;
    std::unique_ptr<CLI::App> app_;

    // Global options
    std::optional<std::string> host_;
    std::optional<uint16_t> port_;
    std::string logLevel_;
    std::string logFile_;
    bool jsonOutput_ = false;

    // Subcommands
    CLI::App* health_ = nullptr;
    CLI::App* add_ = nullptr;
    CLI::App* search_ = nullptr;
    CLI::App* chain_ = nullptr;
    CLI::App* delete_ = nullptr;
    CLI::App* undelete_ = nullptr;
    CLI::App* cleanup_ = nullptr;
    CLI::App* stats_ = nullptr;

    // Subcommand arguments
    std::string text_;
    std::string userId_;
    std::string agentId_;
    std::string memoryId_;
    std::optional<size_t> limit_;
    std::optional<std::string> mode_;
    std::optional<std::string> conceptType_;
    std::vector<std::string> tags_;
    std::string chainMode_ = "both";
    std::optional<size_t> maxDepth_;
    std::string strategy_ = "soft";
    std::string actor_ = "cli";
    std::optional<std::string> reason_;
    bool dryRun_ = false;
};

} // namespace omc::cli
