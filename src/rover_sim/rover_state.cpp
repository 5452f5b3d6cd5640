#include "rover_sim/rover_state.hpp"

namespace rover_sim {

void BehaviorState::reset(double next_move_interval_ms) {
    target_position.reset();
    patrol_points.clear();
    patrol_index = 0;
    think_time_ms = 0.0;
    move_timer_ms = 0.0;
    move_interval_ms = next_move_interval_ms;
    cruise_fraction = 1.0;
    dwelling = false;
    search_start_height.reset();
    target_object.reset();
    examined_objects.clear();
}

}  // namespace rover_sim
