#include <omc/cli/omc_cli.h>
#include <omc/core/executor.h>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        omc::core::WorkerPool pool;
        omc::cli::OmcCli cli(pool.get_executor());
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return omc::cli::kExitFailure;
    }
}
