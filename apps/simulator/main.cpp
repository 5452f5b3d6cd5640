#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "rover_sim/configuration.hpp"
#include "rover_sim/logging.hpp"
#include "rover_sim/simulation_runtime.hpp"
#include "rover_sim/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace rover_sim;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (configuration.log_level) {
            set_log_level(*configuration.log_level);
        }
        get_logger()->info("Rover simulator {} starting", k_version);

        SimulationRuntime runtime{std::move(configuration)};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
        runtime.save_progress();
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
