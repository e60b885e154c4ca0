#pragma once
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <iomanip>

namespace terminal::core::config {

    constexpr std::size_t kSessionIdLength = 32;

    // 128 random bits from the OS entropy source, rendered as 32 lowercase hex chars
    inline std::string generate_session_id() {
        std::random_device rd;
        std::uniform_int_distribution<std::uint32_t> dis;

        std::stringstream ss;
        for (int i = 0; i < 4; ++i) {
            ss << std::hex << std::setw(8) << std::setfill('0') << dis(rd);
        }
        return ss.str();
    }

    // Accepts any letter case; callers normalize with normalize_session_id()
    inline bool is_valid_session_id(const std::string& id) {
        if (id.size() != kSessionIdLength) {
            return false;
        }
        for (const char c : id) {
            if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
                return false;
            }
        }
        return true;
    }

    inline std::string normalize_session_id(std::string id) {
        for (auto& c : id) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return id;
    }

} // namespace terminal::core::config
