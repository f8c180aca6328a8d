#include "redis_storage.hpp"
#include "gate_config.hpp"
#include "event_logger.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <unordered_map>
#include <vector>

namespace llmgate {

namespace {

// KEYS[1] record, ARGV[1] value, ARGV[2] expected generation or "", ARGV[3] now (ms).
// Returns {1, new_generation} or {0, current_generation | -1 when missing}.
const std::string PUT_SCRIPT = R"(
    local current = redis.call('HGET', KEYS[1], 'generation')
    local expected = ARGV[2]

    -- Optimistic concurrency: refuse the write if the record moved on
    if expected ~= '' then
        if not current then
            return {0, -1}
        end
        if tonumber(current) ~= tonumber(expected) then
            return {0, tonumber(current)}
        end
    end

    local generation = 1
    if current then
        generation = tonumber(current) + 1
    end

    redis.call('HSET', KEYS[1], 'value', ARGV[1], 'generation', generation, 'updated_at', ARGV[3])
    return {1, generation}
)";

// KEYS[1] record, ARGV[1] expected generation or "".
// Returns {1, deleted_count} or {0, current_generation | -1 when missing}.
const std::string REMOVE_SCRIPT = R"(
    local expected = ARGV[1]
    if expected ~= '' then
        local current = redis.call('HGET', KEYS[1], 'generation')
        if not current then
            return {0, -1}
        end
        if tonumber(current) ~= tonumber(expected) then
            return {0, tonumber(current)}
        end
    end
    return {1, redis.call('DEL', KEYS[1])}
)";

[[noreturn]] void throw_conflict(const std::string& key, uint64_t expected, long long actual) {
    if (actual < 0) throw StorageConflictError(key, expected, std::nullopt);
    throw StorageConflictError(key, expected, static_cast<uint64_t>(actual));
}

}

RedisStorage::RedisStorage(const GateConfig& config, const Clock& clock)
    : clock_(clock), namespace_(config.redis_namespace) {
    try {
        // Initialize the Redis client using the provided connection string.
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;
        std::cout << "[*] Redis connected: " << config.redis_url << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis connection failed: " << e.what() << "\n";
        connected_ = false;
    }
}

std::string RedisStorage::namespaced(const std::string& key) const {
    return namespace_ + ":" + key;
}

void RedisStorage::ensure_connected(const std::string& key) const {
    if (!connected_) throw StorageError(key, "Redis is not connected");
}

std::string RedisStorage::escape_glob(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    for (char c : input) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::optional<StoredValue> RedisStorage::get(const std::string& key) {
    ensure_connected(key);
    try {
        std::unordered_map<std::string, std::string> fields;
        redis_->hgetall(namespaced(key), std::inserter(fields, fields.begin()));
        if (fields.empty()) return std::nullopt;

        StoredValue record;
        record.key = key;
        record.value = fields["value"];
        record.generation = std::stoull(fields["generation"]);
        record.updated_at_ms = std::stoll(fields["updated_at"]);
        return record;
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, key, e.what());
        throw StorageError(key, std::string("Redis get failed: ") + e.what());
    } catch (const std::logic_error& e) {
        // stoull/stoll on a hash that was not written by this class
        throw StorageError(key, std::string("Malformed record metadata: ") + e.what());
    }
}

StoredValue RedisStorage::put(const std::string& key, const std::string& value,
                              std::optional<uint64_t> expected_generation) {
    ensure_connected(key);

    int64_t now = clock_.now_ms();
    std::vector<std::string> keys = {namespaced(key)};
    std::vector<std::string> args = {
        value,
        expected_generation ? std::to_string(*expected_generation) : std::string(),
        std::to_string(now)
    };

    std::vector<long long> res;
    try {
        redis_->eval(PUT_SCRIPT, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, key, e.what());
        throw StorageError(key, std::string("Redis put failed: ") + e.what());
    }

    if (res.size() < 2) {
        throw StorageError(key, "Unexpected reply from put script");
    }
    if (res[0] == 0) {
        throw_conflict(key, *expected_generation, res[1]);
    }

    StoredValue record;
    record.key = key;
    record.value = value;
    record.generation = static_cast<uint64_t>(res[1]);
    record.updated_at_ms = now;
    return record;
}

std::vector<std::string> RedisStorage::list(const std::string& prefix) {
    ensure_connected(prefix);

    std::vector<std::string> keys;
    try {
        std::string pattern = escape_glob(namespaced(prefix)) + "*";
        long long cursor = 0;
        do {
            cursor = redis_->scan(cursor, pattern, 100, std::back_inserter(keys));
        } while (cursor != 0);
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, prefix, e.what());
        throw StorageError(prefix, std::string("Redis scan failed: ") + e.what());
    }

    // SCAN may repeat keys across iterations and returns them unordered.
    const size_t strip = namespace_.size() + 1;
    for (auto& k : keys) k = k.substr(strip);
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

bool RedisStorage::remove(const std::string& key, std::optional<uint64_t> expected_generation) {
    ensure_connected(key);

    std::vector<std::string> keys = {namespaced(key)};
    std::vector<std::string> args = {
        expected_generation ? std::to_string(*expected_generation) : std::string()
    };

    std::vector<long long> res;
    try {
        redis_->eval(REMOVE_SCRIPT, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, key, e.what());
        throw StorageError(key, std::string("Redis remove failed: ") + e.what());
    }

    if (res.size() < 2) {
        throw StorageError(key, "Unexpected reply from remove script");
    }
    if (res[0] == 0) {
        throw_conflict(key, *expected_generation, res[1]);
    }
    return res[1] > 0;
}

}
