#pragma once
#include <string>
#include <random>
#include <sstream>

namespace inkbridge::core::config {

    // 8 random hex digits prefixed with "req-"; used for log context and slot records.
    inline std::string generate_request_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "req-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace inkbridge::core::config
