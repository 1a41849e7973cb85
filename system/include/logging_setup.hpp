#pragma once
#include <spdlog/spdlog.h>
#include <string>

// Console (colored) + rotating file under log_dir. Safe to call more than once;
// later calls only change the level.
void setup_logging(const std::string& log_dir,
                   spdlog::level::level_enum level = spdlog::level::info);
