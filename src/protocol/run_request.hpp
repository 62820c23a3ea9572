#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace shopagent::protocol {

    // Validated user input required to start a shopping session
    struct RunRequest {
        std::string task_description;
        std::optional<std::filesystem::path> plan_file;     // Replay a scripted plan instead of planning
        std::optional<std::filesystem::path> catalog_file;  // Built-in demo catalog when absent
        std::filesystem::path working_directory = std::filesystem::current_path();
        uint32_t max_steps = 20;
        bool simulate_race = false;
        bool verbose = false;
    };

} // namespace shopagent::protocol
