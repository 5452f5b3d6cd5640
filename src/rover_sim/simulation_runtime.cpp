#include "rover_sim/simulation_runtime.hpp"

#include <array>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "rover_sim/logging.hpp"

namespace rover_sim {

namespace {

constexpr std::array<BehaviorGoal, 7> k_initial_goals{
    BehaviorGoal::Patrol,
    BehaviorGoal::FindRocks,
    BehaviorGoal::FindWater,
    BehaviorGoal::FindFlatSurface,
    BehaviorGoal::Random,
    BehaviorGoal::FindGoodSoil,
    BehaviorGoal::FindGoodWeather,
}; /**< Goals handed out round-robin to freshly spawned rovers. */

/**
 * @brief Registry stream seed derived from the configured seed so rock
 *        placement and rover behavior draw independent sequences.
 */
std::uint32_t registry_seed(std::uint32_t seed) {
    return seed == 0 ? 0 : seed + 1;
}

}  // namespace

SimulationRuntime::SimulationRuntime(Configuration configuration)
    : configuration_(std::move(configuration)),
      logger_(get_logger()),
      terrain_(TerrainDimensions{configuration_.terrain.width, configuration_.terrain.height}, configuration_.terrain.relief),
      random_source_(configuration_.random_seed),
      rock_field_(terrain_, configuration_.rock_count, random_source_),
      event_bus_(),
      registry_(terrain_, event_bus_, &rock_field_, configuration_.tuning, registry_seed(configuration_.random_seed)) {
    if (!(configuration_.update_hz > 0.0)) {
        throw std::invalid_argument("update_hz must be positive");
    }
    if (configuration_.progress_file) {
        progress_store_.emplace(*configuration_.progress_file);
    }
}

SimulationRuntime::~SimulationRuntime() {
    shutdown();
    for (const Unsubscribe& unsubscribe : list_unsubscribe_) {
        unsubscribe();
    }
}

/**
 * @brief Attach log listeners, then resume saved rovers or spawn a fresh set.
 */
void SimulationRuntime::initialize() {
    logger_->info("Initializing simulation runtime");

    list_unsubscribe_.push_back(event_bus_.subscribe(k_event_rover_added, [logger = logger_](const RoverEvent& event) {
        if (event.rover) {
            logger->info("Rover {} online at map ({:.0f}, {:.0f}) pursuing {}",
                         event.rover->identifier,
                         event.rover->coordinates.x,
                         event.rover->coordinates.z,
                         to_string(event.rover->behavior_goal));
        }
    }));
    list_unsubscribe_.push_back(event_bus_.subscribe(k_event_rover_selected, [logger = logger_](const RoverEvent& event) {
        logger->info("Selection changed to {}", event.rover ? event.rover->identifier : std::string{"<none>"});
    }));
    list_unsubscribe_.push_back(event_bus_.subscribe(k_event_rover_updated, [logger = logger_](const RoverEvent& event) {
        if (event.rover) {
            logger->trace("Rover {} at ({:.2f}, {:.2f}) speed {:.2f} battery {:.1f}",
                          event.rover->identifier,
                          event.rover->position.x,
                          event.rover->position.z,
                          event.rover->speed,
                          event.rover->capabilities.battery_level);
        }
    }));

    restore_progress();
    with_registry([this](RoverRegistry& registry) {
        if (registry.size() == 0) {
            spawn_initial_rovers();
        }
        const std::vector<RoverData> list_rovers = registry.get_all_rovers();
        if (!list_rovers.empty()) {
            registry.select_rover(list_rovers.front().identifier);
        }
    });
    event_bus_.dispatch_pending();
}

/**
 * @brief Start the background update thread.
 */
void SimulationRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting simulation run loop at {} Hz", configuration_.update_hz);
    update_thread_ = std::thread(&SimulationRuntime::update_loop, this);
}

/**
 * @brief Stop the update thread and flush queued notifications.
 */
void SimulationRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down simulation runtime");
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
    event_bus_.dispatch_pending();
}

void SimulationRuntime::save_progress() {
    if (!progress_store_) {
        return;
    }
    std::vector<ProgressRecord> list_records;
    with_registry([&list_records](RoverRegistry& registry) {
        list_records = registry.export_progress();
    });
    progress_store_->save(list_records);
}

void SimulationRuntime::with_registry(const std::function<void(RoverRegistry&)>& action) {
    std::lock_guard<std::mutex> lock(mutex_registry_);
    action(registry_);
}

void SimulationRuntime::step(double delta_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_registry_);
        registry_.update(delta_ms);
    }
    event_bus_.dispatch_pending();
}

bool SimulationRuntime::is_running() const noexcept {
    return flag_running_.load();
}

EventBus& SimulationRuntime::event_bus() noexcept {
    return event_bus_;
}

const RockField& SimulationRuntime::rock_field() const noexcept {
    return rock_field_;
}

/**
 * @brief Fixed-timestep loop; each tick advances the registry by the nominal
 *        tick length and periodically logs a status line per rover.
 */
void SimulationRuntime::update_loop() {
    const Duration tick_interval{1.0 / configuration_.update_hz};
    const SteadyClock::duration steady_tick_interval = std::chrono::duration_cast<SteadyClock::duration>(tick_interval);
    const SteadyClock::duration steady_status_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration_.status_interval);
    const double tick_ms = tick_interval.count() * 1'000.0;

    auto next_tick = SteadyClock::now();
    auto next_status = next_tick + steady_status_interval;
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(next_tick - now);
            continue;
        }
        try {
            step(tick_ms);
            if (now >= next_status) {
                log_status();
                next_status = now + steady_status_interval;
            }
        } catch (const std::exception& exc) {
            logger_->error("Update loop error: {}", exc.what());
        }
        next_tick = now + steady_tick_interval;
    }
}

void SimulationRuntime::log_status() {
    std::vector<RoverData> list_rovers;
    with_registry([&list_rovers](RoverRegistry& registry) {
        list_rovers = registry.get_all_rovers();
    });
    for (const RoverData& rover : list_rovers) {
        logger_->info("{}{} goal={} pos=({:.1f}, {:.1f}) speed={:.2f} battery={:.1f}/{:.0f}{}",
                      rover.selected ? "*" : "",
                      rover.identifier,
                      to_string(rover.behavior_goal),
                      rover.position.x,
                      rover.position.z,
                      rover.speed,
                      rover.capabilities.battery_level,
                      rover.capabilities.battery_capacity,
                      rover.distress ? " DISTRESS" : "");
    }
}

void SimulationRuntime::restore_progress() {
    if (!progress_store_) {
        return;
    }
    const std::vector<ProgressRecord> list_records = progress_store_->load();
    with_registry([&list_records](RoverRegistry& registry) {
        for (const ProgressRecord& record : list_records) {
            registry.restore_rover(record);
        }
    });
}

/**
 * @brief Caller must hold the registry lock.
 */
void SimulationRuntime::spawn_initial_rovers() {
    for (std::size_t index = 0; index < configuration_.initial_rover_count; ++index) {
        const std::string identifier = registry_.create_rover();
        const BehaviorGoal goal = k_initial_goals[index % k_initial_goals.size()];
        registry_.set_task(identifier, std::string{to_string(goal)});
    }
    logger_->info("Spawned {} rover(s)", configuration_.initial_rover_count);
}

}  // namespace rover_sim
