#pragma once
#include <random>
#include <sstream>
#include <string>

namespace crucible::core::config {

    // Generates an 8-character id over the lowercase base32 alphabet,
    // the same shape as 5 random bytes encoded with Base32.
    inline std::string generate_short_id() {
        static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 31);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << kAlphabet[dis(gen)];
        }
        return ss.str();
    }

    // Correlation references for handshakes and side requests.
    inline std::string generate_ref() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "ref-";
        for (int i = 0; i < 16; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace crucible::core::config
