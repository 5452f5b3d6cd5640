// === Rover Registry ==========================================================
//
// Single source of truth for live rovers. Owns identity, selection and
// lifecycle, sequences the per-tick pipeline (resource model, behavior,
// movement, boundary clamp, throttled notification) and projects rovers into
// UI snapshots and persistence records.
//
// The registry is not thread-safe; hosts that tick it from a worker thread
// must serialize every call (see `SimulationRuntime`).

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "rover_sim/capabilities.hpp"
#include "rover_sim/notification_bus.hpp"
#include "rover_sim/random_source.hpp"
#include "rover_sim/resource_model.hpp"
#include "rover_sim/rover_behaviors.hpp"
#include "rover_sim/rover_data.hpp"
#include "rover_sim/rover_movement.hpp"
#include "rover_sim/rover_state.hpp"
#include "rover_sim/terrain.hpp"
#include "rover_sim/tuning.hpp"

namespace rover_sim {

class RoverRegistry final {
  public:
    /**
     * @param terrain Height and extent queries; must outlive the registry.
     * @param bus Receives roverAdded/roverUpdated/roverSelected; must outlive the registry.
     * @param object_query Optional rock lookup for the rock survey goal.
     * @param seed Random seed; zero requests a nondeterministic seed.
     */
    RoverRegistry(
        const TerrainHeightProvider& terrain,
        NotificationBus& bus,
        const TerrainObjectQuery* object_query = nullptr,
        SimulationTuning tuning = SimulationTuning{},
        std::uint32_t seed = 0
    );

    RoverRegistry(const RoverRegistry&) = delete;
    RoverRegistry& operator=(const RoverRegistry&) = delete;

    /**
     * @brief Create a rover at @p position, or at a random point inside the
     *        terrain margin when omitted. Emits roverAdded.
     */
    std::string create_rover(std::optional<Vec2> position = std::nullopt);
    /** @brief Create a rover and select it. */
    RoverData add_rover(std::optional<Vec2> position = std::nullopt);
    /**
     * @brief Recreate a rover from a persisted record, keeping its identifier.
     *
     * @return The identifier, or empty if a rover with that id already exists.
     */
    std::optional<std::string> restore_rover(const ProgressRecord& record);

    /**
     * @brief Select @p identifier, or clear the selection with std::nullopt.
     *
     * An unknown identifier is logged and leaves the selection unchanged.
     */
    bool select_rover(const std::optional<std::string>& identifier);
    /** @brief Set the task label and reinterpret it as the behavior goal. */
    bool set_task(const std::string& identifier, const std::string& task);
    bool set_capabilities(const std::string& identifier, const CapabilityPatch& patch);
    bool remove_rover(const std::string& identifier);

    /** @brief Advance every rover by one frame of @p delta_ms milliseconds. */
    void update(double delta_ms);

    [[nodiscard]] const Rover* get_rover(const std::string& identifier) const;
    [[nodiscard]] std::optional<RoverData> get_rover_data(const std::string& identifier) const;
    [[nodiscard]] std::vector<RoverData> get_all_rovers() const;
    [[nodiscard]] std::optional<RoverData> get_selected_rover() const;
    [[nodiscard]] const std::optional<std::string>& selected_rover_id() const noexcept;
    [[nodiscard]] std::optional<ProgressRecord> get_progress_record(const std::string& identifier) const;
    [[nodiscard]] std::vector<ProgressRecord> export_progress() const;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] double simulation_time_ms() const noexcept;
    [[nodiscard]] const SimulationTuning& tuning() const noexcept;

  private:
    Rover* find_rover(const std::string& identifier);
    std::string next_identifier();
    Rover& insert_rover(std::string identifier, const Vec2& position);
    [[nodiscard]] double resolve_height(double x, double z) const;
    [[nodiscard]] Vec2 clamp_to_bounds(const Vec2& position) const;
    void settle_on_terrain(Rover& rover);
    void publish(std::string_view event_name, const Rover& rover);
    void publish_throttled(const Rover& rover);

    const TerrainHeightProvider& terrain_;
    NotificationBus& bus_;
    SimulationTuning tuning_;
    RandomSource random_source_;
    RoverMovement movement_;
    ResourceModel resource_model_;
    RoverBehaviors behaviors_;
    std::unordered_map<std::string, Rover> map_rovers_;
    std::vector<std::string> list_rover_order_;
    std::unordered_map<std::string, double> map_last_notified_ms_;
    std::optional<std::string> selected_rover_id_;
    std::uint64_t next_rover_number_{1};
    double simulation_time_ms_{};
};

}  // namespace rover_sim
