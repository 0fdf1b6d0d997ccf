#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace banking::utils {

/**
 * @brief Генератор идентификаторов
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string uuid() {
        auto& gen = engine();
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);
        return ss.str();
    }

    /**
     * @brief ID с префиксом: "acc-0123456789abcdef"
     */
    static std::string withPrefix(const std::string& prefix) {
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << dist(engine());
        return ss.str();
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        return gen;
    }
};

} // namespace banking::utils
