#pragma once
#include <random>
#include <sstream>
#include <string>

namespace tailcall::core::config {

    // "<prefix>-" followed by 8 random hex digits, e.g. "run-3fa9c01b".
    inline std::string generate_run_id(const std::string& prefix = "run") {
        static thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::ostringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace tailcall::core::config
