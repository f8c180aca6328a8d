#include "gate_config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace llmgate {

namespace {

template <class T>
T parse_number(const char* name, const char* raw) {
    const std::string value(raw);
    try {
        size_t consumed = 0;
        T parsed;
        if constexpr (std::is_floating_point_v<T>) {
            parsed = static_cast<T>(std::stod(value, &consumed));
        } else if constexpr (std::is_signed_v<T>) {
            parsed = static_cast<T>(std::stoll(value, &consumed));
        } else {
            if (!value.empty() && value[0] == '-') throw std::invalid_argument("negative");
            parsed = static_cast<T>(std::stoull(value, &consumed));
        }
        if (consumed != value.size()) throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a valid number: '" + value + "'");
    }
}

template <class T>
void override_number(const char* name, T& field) {
    if (const char* e = std::getenv(name)) field = parse_number<T>(name, e);
}

void override_string(const char* name, std::string& field) {
    if (const char* e = std::getenv(name)) field = e;
}

void require(bool condition, const std::string& message) {
    if (!condition) throw std::invalid_argument(message);
}

}

void apply_env_overrides(GateConfig& config) {
    // Governor limits
    override_number("LLMGATE_REQUESTS_PER_WINDOW", config.governor.requests_per_window);
    override_number("LLMGATE_TOKENS_PER_WINDOW", config.governor.tokens_per_window);
    override_number("LLMGATE_WINDOW_MS", config.governor.window_duration_ms);
    override_number("LLMGATE_MAX_CONCURRENT", config.governor.max_concurrent);
    override_number("LLMGATE_FAILURE_THRESHOLD", config.governor.failure_threshold);
    override_number("LLMGATE_RECOVERY_TIMEOUT_MS", config.governor.recovery_timeout_ms);
    override_number("LLMGATE_SUCCESS_THRESHOLD", config.governor.success_threshold);

    // Reconciliation thresholds
    override_number("LLMGATE_AUTO_LINK_THRESHOLD", config.reconciliation.auto_link_threshold);
    override_number("LLMGATE_QUEUE_THRESHOLD", config.reconciliation.queue_threshold);
    override_number("LLMGATE_MAX_CANDIDATES", config.reconciliation.max_candidates);
    override_string("LLMGATE_LANGUAGE", config.reconciliation.language);

    // Persistence
    override_string("LLMGATE_STORAGE", config.storage_backend);
    override_string("LLMGATE_REDIS_URL", config.redis_url);
    override_string("LLMGATE_REDIS_NAMESPACE", config.redis_namespace);

    // Registry
    override_string("LLMGATE_WIKIDATA_HOST", config.wikidata_host);
    override_string("LLMGATE_WIKIDATA_PORT", config.wikidata_port);
    override_string("LLMGATE_WIKIDATA_PATH", config.wikidata_path);
    override_string("LLMGATE_USER_AGENT", config.user_agent);
    override_number("LLMGATE_SEARCH_TIMEOUT_SEC", config.search_timeout_sec);
}

void validate_config(const GovernorConfig& config) {
    require(config.requests_per_window > 0, "requests_per_window must be positive");
    require(config.tokens_per_window > 0, "tokens_per_window must be positive");
    require(config.window_duration_ms > 0, "window_duration_ms must be positive");
    require(config.max_concurrent > 0, "max_concurrent must be positive");
    require(config.failure_threshold > 0, "failure_threshold must be positive");
    require(config.recovery_timeout_ms >= 0, "recovery_timeout_ms must not be negative");
    require(config.success_threshold > 0, "success_threshold must be positive");
}

void validate_config(const ReconciliationConfig& config) {
    require(config.auto_link_threshold >= 0.0 && config.auto_link_threshold <= 100.0,
            "auto_link_threshold must be within 0-100");
    require(config.queue_threshold >= 0.0 && config.queue_threshold <= 100.0,
            "queue_threshold must be within 0-100");
    require(config.auto_link_threshold >= config.queue_threshold,
            "auto_link_threshold must not be below queue_threshold");
    require(config.max_candidates > 0, "max_candidates must be positive");
    require(!config.language.empty(), "language must not be empty");
}

void validate_config(const GateConfig& config) {
    validate_config(config.governor);
    validate_config(config.reconciliation);
    require(config.storage_backend == "memory" || config.storage_backend == "redis",
            "storage_backend must be 'memory' or 'redis'");
    require(!config.wikidata_host.empty(), "wikidata_host must not be empty");
    require(config.search_timeout_sec > 0, "search_timeout_sec must be positive");
}

bool has_durable_storage(const GateConfig& config) {
    return config.storage_backend == "redis";
}

}
