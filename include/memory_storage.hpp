#pragma once

#include <map>
#include <mutex>

#include "clock.hpp"
#include "key_value_storage.hpp"

namespace llmgate {

// Process-local storage backend. Default for the CLI and used by tests.
class MemoryStorage : public KeyValueStorage {
public:
    explicit MemoryStorage(const Clock& clock);

    std::optional<StoredValue> get(const std::string& key) override;
    StoredValue put(const std::string& key, const std::string& value,
                    std::optional<uint64_t> expected_generation = std::nullopt) override;
    std::vector<std::string> list(const std::string& prefix) override;
    bool remove(const std::string& key,
                std::optional<uint64_t> expected_generation = std::nullopt) override;

    size_t size() const;

private:
    void check_generation(const std::string& key, std::optional<uint64_t> expected) const;

    const Clock& clock_;
    mutable std::mutex mutex_;
    std::map<std::string, StoredValue> records_;
};

}
