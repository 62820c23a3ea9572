#pragma once
#include <string>
#include <random>
#include <sstream>

namespace shopagent::core::config {

    // 8 random hex digits prefixed with "session-"
    inline std::string generate_session_id() {
        static thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "session-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace shopagent::core::config
