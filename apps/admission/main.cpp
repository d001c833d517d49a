#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "airspace/airspace_runtime.hpp"
#include "airspace/configuration.hpp"
#include "airspace/logging.hpp"
#include "airspace/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace airspace;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        set_log_level(configuration.log_level);

        get_logger()->info("airspace_admission v{} starting", k_version);

        AirspaceRuntime runtime{configuration};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
        const FlightStatistics stats = runtime.service().statistics();
        get_logger()->info(
            R"({{"component":"app","event":"stopped","flights":{},"pending":{},"approved":{},"active":{},"completed":{},"cancelled":{},"rejected":{}}})",
            stats.total,
            stats.pending,
            stats.approved,
            stats.active,
            stats.completed,
            stats.cancelled,
            stats.rejected
        );
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
