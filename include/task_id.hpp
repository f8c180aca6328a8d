#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <openssl/rand.h>

namespace llmgate {

// Generates verification task identifiers: "task-<base36 ms>-<6 random base36>".
class TaskIdGenerator {
public:
    static constexpr size_t RANDOM_SUFFIX_LENGTH = 6;

    static std::string generate(int64_t now_ms) {
        return "task-" + to_base36(static_cast<uint64_t>(now_ms < 0 ? 0 : now_ms)) + "-" + random_suffix();
    }

    static std::string to_base36(uint64_t value) {
        static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
        if (value == 0) return "0";
        std::string out;
        while (value > 0) {
            out.insert(out.begin(), digits[value % 36]);
            value /= 36;
        }
        return out;
    }

    static std::string random_suffix() {
        static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
        unsigned char buffer[RANDOM_SUFFIX_LENGTH];
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw std::runtime_error("CSPRNG failure while generating task id");
        }

        std::string out;
        out.reserve(RANDOM_SUFFIX_LENGTH);
        for (unsigned char b : buffer) {
            // Modulo bias: digits 0-3 are marginally more likely.
            out += digits[b % 36];
        }
        return out;
    }
};

}
