#pragma once
#include <string>
#include <random>
#include <sstream>

namespace relay::core::config {

    // Generates a random version-4 UUID string, e.g.
    // "3f2a9c1e-7b4d-4e0a-9c3f-1d2e3f4a5b6c".
    inline std::string generate_exchange_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);
        std::uniform_int_distribution<> variant_dis(8, 11);

        std::stringstream ss;
        ss << std::hex;
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) {
                ss << '-';
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

} // namespace relay::core::config
