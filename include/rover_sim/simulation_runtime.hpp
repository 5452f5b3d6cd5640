// === Simulation Runtime ======================================================
//
// Host for the rover simulation core. Wires configuration, procedural
// terrain, the rock field, the event bus and the registry together, runs the
// fixed-rate update loop on a worker thread and persists progress.
//
// The registry is owned by the update thread; every other caller goes through
// `with_registry`, which serializes access with the update tick.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "rover_sim/configuration.hpp"
#include "rover_sim/notification_bus.hpp"
#include "rover_sim/progress_store.hpp"
#include "rover_sim/random_source.hpp"
#include "rover_sim/rover_registry.hpp"
#include "rover_sim/terrain.hpp"

namespace rover_sim {

/** @brief High-level orchestrator managing the update thread and persistence. */
class SimulationRuntime final {
  public:
    explicit SimulationRuntime(Configuration configuration);
    ~SimulationRuntime();

    SimulationRuntime(const SimulationRuntime&) = delete;
    SimulationRuntime& operator=(const SimulationRuntime&) = delete;

    /** @brief Subscribe log listeners and restore or spawn the initial rovers. */
    void initialize();
    /** @brief Start the background update loop. */
    void run();
    /** @brief Stop the update loop and deliver outstanding notifications. */
    void shutdown();
    /**
     * @brief Write every rover to the configured progress file, if any.
     *
     * @throws std::runtime_error if the file cannot be written.
     */
    void save_progress();

    /** @brief Run @p action with exclusive access to the registry. */
    void with_registry(const std::function<void(RoverRegistry&)>& action);
    /** @brief Advance the simulation by one tick and deliver its notifications. */
    void step(double delta_ms);

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] EventBus& event_bus() noexcept;
    [[nodiscard]] const RockField& rock_field() const noexcept;

  private:
    /** @brief Fixed-timestep loop advancing the registry. */
    void update_loop();
    void log_status();
    void restore_progress();
    void spawn_initial_rovers();

    Configuration configuration_;
    std::shared_ptr<spdlog::logger> logger_;
    ProceduralTerrain terrain_;
    RandomSource random_source_;
    RockField rock_field_;
    EventBus event_bus_;
    RoverRegistry registry_;
    std::optional<ProgressStore> progress_store_;
    std::vector<Unsubscribe> list_unsubscribe_;
    std::mutex mutex_registry_;
    std::atomic<bool> flag_running_{false};
    std::thread update_thread_;
};

}  // namespace rover_sim
