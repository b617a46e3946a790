#pragma once
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace agentrt::core::config {

    // Random RFC 4122 version-4 UUID, e.g. "3f2b8c1e-9a4d-4e7f-b1c2-5d6e7f8a9b0c"
    inline std::string generate_uuid() {
        thread_local std::mt19937_64 gen{std::random_device{}()};
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
            ss << std::setw(2) << static_cast<unsigned int>(bytes[i]);
        }
        return ss.str();
    }

    inline std::string generate_session_id() {
        return generate_uuid();
    }

    // "response_<uuid>", "msg_<uuid>", ...
    inline std::string generate_prefixed_id(const std::string& prefix) {
        return prefix + "_" + generate_uuid();
    }

} // namespace agentrt::core::config
