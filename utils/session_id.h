#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace treescout::utils {

    // 128 random bits rendered as 32 lower-case hex digits
    inline std::string generate_session_id() {
        static thread_local std::mt19937_64 gen{std::random_device{}()};
        std::uniform_int_distribution<std::uint64_t> dist;

        std::uint64_t part1 = dist(gen);
        std::uint64_t part2 = dist(gen);

        std::stringstream ss;
        ss << std::hex << std::setw(16) << std::setfill('0') << part1
           << std::hex << std::setw(16) << std::setfill('0') << part2;
        return ss.str();
    }

    inline bool is_session_id(const std::string &text) {
        if (text.size() != 32) {
            return false;
        }
        for (char c: text) {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex) {
                return false;
            }
        }
        return true;
    }

}// namespace treescout::utils
