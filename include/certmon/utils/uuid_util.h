#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace certmon::utils {

/**
 * Run identifiers: random (version 4) UUIDs in lowercase 8-4-4-4-12 form.
 */
class UuidUtil {
public:
    /// Safe to call from several threads.
    static std::string generate() {
        static std::mutex mutex;
        static std::mt19937_64 engine{std::random_device{}()};

        std::array<uint8_t, 16> bytes{};
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (size_t i = 0; i < bytes.size(); i += 8) {
                uint64_t word = engine();
                for (size_t j = 0; j < 8; ++j) {
                    bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
                }
            }
        }

        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

        static const char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(HEX[bytes[i] >> 4]);
            out.push_back(HEX[bytes[i] & 0x0F]);
        }
        return out;
    }

    static bool isValid(const std::string& uuid) {
        if (uuid.size() != 36) return false;
        for (size_t i = 0; i < uuid.size(); ++i) {
            bool dash = i == 8 || i == 13 || i == 18 || i == 23;
            char c = uuid[i];
            if (dash != (c == '-')) return false;
            if (!dash && !((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
        }
        return true;
    }
};

} // namespace certmon::utils
