#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

#include "clock.hpp"
#include "key_value_storage.hpp"

namespace llmgate {

struct GateConfig;

// Redis-backed storage so that links and review tasks survive restarts and
// can be reviewed from another process.
// Each record is a hash {value, generation, updated_at} under
// "<namespace>:<key>"; writes run as Lua scripts so the generation check and
// the write are atomic.
class RedisStorage : public KeyValueStorage {
public:
    RedisStorage(const GateConfig& config, const Clock& clock);
    ~RedisStorage() override = default;

    // Connection health check, established by a PING at construction.
    bool is_connected() const { return connected_; }

    std::optional<StoredValue> get(const std::string& key) override;
    StoredValue put(const std::string& key, const std::string& value,
                    std::optional<uint64_t> expected_generation = std::nullopt) override;
    std::vector<std::string> list(const std::string& prefix) override;
    bool remove(const std::string& key,
                std::optional<uint64_t> expected_generation = std::nullopt) override;

    // Escapes Redis glob metacharacters so a prefix matches literally.
    static std::string escape_glob(const std::string& input);

private:
    std::string namespaced(const std::string& key) const;
    void ensure_connected(const std::string& key) const;

    std::unique_ptr<sw::redis::Redis> redis_;
    const Clock& clock_;
    std::string namespace_;
    std::atomic<bool> connected_{false};
};

}
