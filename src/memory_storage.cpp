#include "memory_storage.hpp"

namespace llmgate {

MemoryStorage::MemoryStorage(const Clock& clock) : clock_(clock) {}

// Caller holds mutex_.
void MemoryStorage::check_generation(const std::string& key, std::optional<uint64_t> expected) const {
    if (!expected) return;
    auto it = records_.find(key);
    if (it == records_.end()) {
        throw StorageConflictError(key, *expected, std::nullopt);
    }
    if (it->second.generation != *expected) {
        throw StorageConflictError(key, *expected, it->second.generation);
    }
}

std::optional<StoredValue> MemoryStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

StoredValue MemoryStorage::put(const std::string& key, const std::string& value,
                               std::optional<uint64_t> expected_generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_generation(key, expected_generation);

    StoredValue& record = records_[key];
    record.key = key;
    record.value = value;
    record.generation += 1;
    record.updated_at_ms = clock_.now_ms();
    return record;
}

std::vector<std::string> MemoryStorage::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = records_.lower_bound(prefix); it != records_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(it->first);
    }
    return keys;
}

bool MemoryStorage::remove(const std::string& key, std::optional<uint64_t> expected_generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_generation(key, expected_generation);
    return records_.erase(key) > 0;
}

size_t MemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}
