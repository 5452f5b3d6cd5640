// === Progress Store ==========================================================
//
// File-backed stand-in for the persistence collaborator. Saves and loads the
// flat per-rover progress records as a YAML document:
//
//   progress:
//     - robotId: rover-1
//       position: {x: 12.5, z: -40.25}
//       height: 143
//       coordinates: {x: 1013, z: 960}
//       behaviorGoal: patrol
//       speed: 0.42
//       capabilities: {maxSpeed: 0.5, turnRate: 0.05, ...}

#pragma once

#include <filesystem>
#include <vector>

#include "rover_sim/rover_data.hpp"

namespace rover_sim {

class ProgressStore final {
  public:
    explicit ProgressStore(std::filesystem::path path);

    /**
     * @brief Overwrite the file with @p list_records.
     *
     * @throws std::runtime_error if the file cannot be written.
     */
    void save(const std::vector<ProgressRecord>& list_records) const;

    /**
     * @brief Read every well-formed record from the file.
     *
     * A missing file yields no records. Records without an identifier or
     * position are skipped with a warning; missing capability fields take
     * their defaults and the result is clamped.
     *
     * @throws std::runtime_error if the file exists but is not valid YAML.
     */
    [[nodiscard]] std::vector<ProgressRecord> load() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

  private:
    std::filesystem::path path_;
};

}  // namespace rover_sim
