#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace rover_sim {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief Escape @p text for embedding in a JSON string literal. */
std::string escape_json(std::string_view text);

}  // namespace rover_sim
