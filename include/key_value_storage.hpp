#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmgate {

// A stored record with its write generation (1 after the first write).
struct StoredValue {
    std::string key;
    std::string value;
    uint64_t generation = 0;
    int64_t updated_at_ms = 0;
};

// Raised for any backend failure (connection loss, protocol error, ...).
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& key, const std::string& message)
        : std::runtime_error(message), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Optimistic-concurrency mismatch: the record changed since it was read.
class StorageConflictError : public StorageError {
public:
    StorageConflictError(const std::string& key, uint64_t expected, std::optional<uint64_t> actual)
        : StorageError(key, "Generation conflict on '" + key + "': expected " + std::to_string(expected) +
                            ", found " + (actual ? std::to_string(*actual) : std::string("none")))
        , expected_(expected), actual_(actual) {}

    uint64_t expected_generation() const { return expected_; }
    std::optional<uint64_t> actual_generation() const { return actual_; }

private:
    uint64_t expected_;
    std::optional<uint64_t> actual_;
};

// Abstract interface for the durable key-value store behind reconciliation.
// In-memory and Redis implementations are provided.
class KeyValueStorage {
public:
    virtual ~KeyValueStorage() = default;

    /**
     * Reads a record.
     * @return The record, or nullopt if the key does not exist.
     * @throws StorageError on backend failure.
     */
    virtual std::optional<StoredValue> get(const std::string& key) = 0;

    /**
     * Writes a record, creating or replacing it.
     * @param expected_generation When set, the write only happens if the stored
     *        generation still matches; otherwise StorageConflictError is thrown.
     * @return The record as written.
     */
    virtual StoredValue put(const std::string& key, const std::string& value,
                            std::optional<uint64_t> expected_generation = std::nullopt) = 0;

    // Keys beginning with `prefix`, in ascending order.
    virtual std::vector<std::string> list(const std::string& prefix) = 0;

    // Returns true if a record was deleted.
    virtual bool remove(const std::string& key,
                        std::optional<uint64_t> expected_generation = std::nullopt) = 0;
};

}
