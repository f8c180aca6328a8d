#pragma once

#include <string>
#include <cstdint>

namespace llmgate {

// Admission limits for calls to the external model provider.
struct GovernorConfig {
    // --- Fixed-window throughput ---
    uint32_t requests_per_window = 50;
    uint64_t tokens_per_window = 100000;
    int64_t window_duration_ms = 60000;

    // --- Concurrency gate ---
    uint32_t max_concurrent = 5;

    // --- Circuit breaker ---
    uint32_t failure_threshold = 5;     // Consecutive failures before the circuit opens
    int64_t recovery_timeout_ms = 120000;
    uint32_t success_threshold = 2;     // Consecutive half-open successes before it closes
};

// Decision thresholds for entity reconciliation against the external registry.
struct ReconciliationConfig {
    double auto_link_threshold = 90.0;  // 0-100
    double queue_threshold = 50.0;      // 0-100
    uint32_t max_candidates = 5;
    std::string language = "en";
};

// Process-wide configuration, assembled from defaults and LLMGATE_* variables.
struct GateConfig {
    GovernorConfig governor;
    ReconciliationConfig reconciliation;

    // --- Persistence ---
    std::string storage_backend = "memory";  // "memory" or "redis"
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string redis_namespace = "llmgate";

    // --- Candidate registry (Wikidata) ---
    std::string wikidata_host = "www.wikidata.org";
    std::string wikidata_port = "443";
    std::string wikidata_path = "/w/api.php";
    std::string user_agent = "llmgate/1.0 (entity reconciliation)";
    int search_timeout_sec = 10;
};

// Applies LLMGATE_* environment variables on top of `config`.
// Throws std::invalid_argument when a numeric variable does not parse.
void apply_env_overrides(GateConfig& config);

// Throws std::invalid_argument describing the first offending field.
void validate_config(const GovernorConfig& config);
void validate_config(const ReconciliationConfig& config);
void validate_config(const GateConfig& config);

// True when tasks and links outlive the process, i.e. the Redis backend.
bool has_durable_storage(const GateConfig& config);

}
