#pragma once
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace orch::core::config {

    // Random RFC 4122 version-4 UUID, lowercase hex.
    inline std::string generate_uuid() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned int> dis(0, 255);

        unsigned char bytes[16];
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(dis(gen));
        }
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Short 8-character hex ID prefixed with "agent-"
    inline std::string generate_agent_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "agent-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace orch::core::config
