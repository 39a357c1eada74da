#pragma once
#include <random>
#include <sstream>
#include <string>

namespace snipexec::core::config {

    // Generates a random UUID-v4 style id, e.g. "3f2b9c1e-5a7d-4e80-9b21-0c6d8e4fa713".
    inline std::string generate_session_id() {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);
        std::uniform_int_distribution<> variant_dis(8, 11);

        std::stringstream ss;
        ss << std::hex;
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) {
                ss << "-";
            }
            if (i == 12) {
                ss << 4;
            } else if (i == 16) {
                ss << variant_dis(gen);
            } else {
                ss << dis(gen);
            }
        }
        return ss.str();
    }

} // namespace snipexec::core::config
