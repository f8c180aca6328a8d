#include "reconciliation_engine.hpp"
#include "event_logger.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "task_id.hpp"
#include "uri_codec.hpp"

#include <algorithm>

namespace json = boost::json;

namespace llmgate {

namespace {

std::string describe(std::exception_ptr cause) {
    if (!cause) return {};
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    }
}

// Must be called from inside a catch block.
[[noreturn]] void rethrow_wrapped(const std::string& operation,
                                  const std::string& entity_iri,
                                  const std::string& task_id) {
    auto cause = std::current_exception();
    EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE,
                     task_id.empty() ? entity_iri : task_id, operation + ": " + describe(cause));
    throw ReconciliationError(operation + " failed", entity_iri, task_id, cause);
}

const json::value& require(const json::object& obj, const char* field) {
    auto* v = obj.if_contains(field);
    if (!v) throw std::invalid_argument(std::string("missing field '") + field + "'");
    return *v;
}

std::string require_string(const json::object& obj, const char* field) {
    const auto& v = require(obj, field);
    if (!v.is_string()) throw std::invalid_argument(std::string("field '") + field + "' is not a string");
    return std::string(v.as_string());
}

int64_t require_int(const json::object& obj, const char* field) {
    const auto& v = require(obj, field);
    if (v.is_int64()) return v.as_int64();
    if (v.is_uint64()) return static_cast<int64_t>(v.as_uint64());
    throw std::invalid_argument(std::string("field '") + field + "' is not an integer");
}

const json::object& require_object(const json::value& v) {
    if (!v.is_object()) throw std::invalid_argument("record is not an object");
    return v.as_object();
}

}

std::string to_string(ReconciliationDecision decision) {
    switch (decision) {
        case ReconciliationDecision::AutoLinked: return "auto_linked";
        case ReconciliationDecision::Queued: return "queued";
        case ReconciliationDecision::NoMatch: return "no_match";
        case ReconciliationDecision::Skipped: return "skipped";
    }
    return "unknown";
}

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Approved: return "approved";
        case TaskStatus::Rejected: return "rejected";
    }
    return "unknown";
}

std::optional<TaskStatus> parse_task_status(const std::string& text) {
    if (text == "pending") return TaskStatus::Pending;
    if (text == "approved") return TaskStatus::Approved;
    if (text == "rejected") return TaskStatus::Rejected;
    return std::nullopt;
}

ReconciliationError::ReconciliationError(const std::string& message,
                                         std::string entity_iri,
                                         std::string task_id,
                                         std::exception_ptr cause)
    : std::runtime_error(cause ? message + ": " + describe(cause) : message)
    , entity_iri_(std::move(entity_iri))
    , task_id_(std::move(task_id))
    , cause_(cause)
{}

namespace records {

std::string link_key(const std::string& entity_iri) {
    return LINKS_PREFIX + encode_uri_component(entity_iri);
}

std::string task_key(const std::string& task_id) {
    return QUEUE_PREFIX + task_id;
}

std::string entity_uri(const std::string& external_id) {
    return "http://www.wikidata.org/entity/" + external_id;
}

json::object encode_candidate(const Candidate& candidate) {
    json::object obj;
    obj["id"] = candidate.id;
    obj["score"] = candidate.score;
    obj["label"] = candidate.label;
    if (candidate.description) {
        obj["description"] = *candidate.description;
    }
    return obj;
}

Candidate decode_candidate(const json::value& value) {
    const auto& obj = require_object(value);
    Candidate candidate;
    candidate.id = require_string(obj, "id");
    candidate.label = require_string(obj, "label");
    const auto& score = require(obj, "score");
    if (!score.is_number()) throw std::invalid_argument("field 'score' is not a number");
    candidate.score = score.to_number<double>();
    if (auto* d = obj.if_contains("description"); d && d->is_string()) {
        candidate.description = std::string(d->as_string());
    }
    return candidate;
}

std::string encode_task(const VerificationTask& task) {
    json::array candidates;
    for (const auto& c : task.candidates) {
        candidates.push_back(encode_candidate(c));
    }

    json::object obj;
    obj["id"] = task.id;
    obj["entityIri"] = task.entity_iri;
    obj["label"] = task.label;
    obj["candidates"] = std::move(candidates);
    obj["createdAt"] = task.created_at_ms;
    obj["status"] = to_string(task.status);
    if (task.approved_id) {
        obj["approvedId"] = *task.approved_id;
    } else {
        obj["approvedId"] = nullptr;
    }
    return json::serialize(obj);
}

VerificationTask decode_task(const std::string& text) {
    json::value parsed = InputValidator::safe_parse_json(text);
    const auto& obj = require_object(parsed);

    VerificationTask task;
    task.id = require_string(obj, "id");
    task.entity_iri = require_string(obj, "entityIri");
    task.label = require_string(obj, "label");
    task.created_at_ms = require_int(obj, "createdAt");

    auto status = parse_task_status(require_string(obj, "status"));
    if (!status) throw std::invalid_argument("unknown task status");
    task.status = *status;

    const auto& candidates = require(obj, "candidates");
    if (!candidates.is_array()) throw std::invalid_argument("field 'candidates' is not an array");
    for (const auto& c : candidates.as_array()) {
        task.candidates.push_back(decode_candidate(c));
    }

    if (auto* a = obj.if_contains("approvedId"); a && a->is_string()) {
        task.approved_id = std::string(a->as_string());
    }
    return task;
}

std::string encode_link(const Link& link) {
    json::object obj;
    obj["entityIri"] = link.entity_iri;
    obj["id"] = link.external_id;
    obj["uri"] = link.uri;
    obj["linkedAt"] = link.linked_at_ms;
    return json::serialize(obj);
}

Link decode_link(const std::string& text) {
    json::value parsed = InputValidator::safe_parse_json(text);
    const auto& obj = require_object(parsed);

    Link link;
    link.entity_iri = require_string(obj, "entityIri");
    link.external_id = require_string(obj, "id");
    link.linked_at_ms = require_int(obj, "linkedAt");
    if (auto* u = obj.if_contains("uri"); u && u->is_string()) {
        link.uri = std::string(u->as_string());
    } else {
        link.uri = entity_uri(link.external_id);
    }
    return link;
}

}

ReconciliationEngine::ReconciliationEngine(KeyValueStorage& storage,
                                           CandidateSearchClient& search,
                                           const Clock& clock)
    : storage_(storage), search_(search), clock_(clock) {}

ReconciliationResult ReconciliationEngine::reconcile_entity(const std::string& entity_iri,
                                                            const std::string& label,
                                                            const std::vector<std::string>& types,
                                                            const ReconciliationConfig& config) {
    validate_config(config);

    ReconciliationResult result;
    result.entity_iri = entity_iri;
    result.label = label;

    bool linked;
    try {
        linked = storage_.get(records::link_key(entity_iri)).has_value();
    } catch (const StorageError&) {
        rethrow_wrapped("Lookup link", entity_iri, {});
    }
    if (linked) {
        result.decision = ReconciliationDecision::Skipped;
        return record(std::move(result));
    }

    SearchOptions options;
    options.language = config.language;
    options.limit = config.max_candidates;
    options.types = types;
    result.candidates = search_.search(label, options);

    if (result.candidates.empty()) {
        result.decision = ReconciliationDecision::NoMatch;
        return record(std::move(result));
    }

    const Candidate& best = result.candidates.front();
    result.best_match = best;

    if (best.score >= config.auto_link_threshold) {
        store_link(entity_iri, best.id);
        result.decision = ReconciliationDecision::AutoLinked;
    } else if (best.score >= config.queue_threshold) {
        result.verification_task_id = queue_for_verification(entity_iri, label, result.candidates);
        result.decision = ReconciliationDecision::Queued;
    } else {
        result.decision = ReconciliationDecision::NoMatch;
    }
    return record(std::move(result));
}

std::vector<ReconciliationResult> ReconciliationEngine::reconcile_batch(const std::vector<EntityRef>& entities,
                                                                        const ReconciliationConfig& config) {
    validate_config(config);

    std::vector<ReconciliationResult> results;
    results.reserve(entities.size());
    for (const auto& entity : entities) {
        results.push_back(reconcile_entity(entity.iri, entity.label, entity.types, config));
    }
    return results;
}

std::string ReconciliationEngine::queue_for_verification(const std::string& entity_iri,
                                                         const std::string& label,
                                                         const std::vector<Candidate>& candidates) {
    VerificationTask task;
    task.created_at_ms = clock_.now_ms();
    task.id = TaskIdGenerator::generate(task.created_at_ms);
    task.entity_iri = entity_iri;
    task.label = label;
    task.candidates = candidates;
    task.status = TaskStatus::Pending;

    try {
        storage_.put(records::task_key(task.id), records::encode_task(task));
    } catch (const StorageError&) {
        rethrow_wrapped("Queue verification", entity_iri, task.id);
    }
    return task.id;
}

void ReconciliationEngine::approve_task(const std::string& task_id, const std::string& chosen_id) {
    // The link URI is derived from the id, so only well-formed item ids are accepted.
    if (!InputValidator::is_valid_entity_id(chosen_id)) {
        throw ReconciliationError("Approve task failed: invalid item id '" + chosen_id + "'", {}, task_id);
    }
    finish_task(task_id, TaskStatus::Approved, chosen_id, "Approve task");
}

void ReconciliationEngine::reject_task(const std::string& task_id) {
    finish_task(task_id, TaskStatus::Rejected, std::nullopt, "Reject task");
}

void ReconciliationEngine::finish_task(const std::string& task_id, TaskStatus status,
                                       const std::optional<std::string>& approved_id,
                                       const std::string& operation) {
    const std::string key = records::task_key(task_id);

    std::optional<StoredValue> stored;
    try {
        stored = storage_.get(key);
    } catch (const StorageError&) {
        rethrow_wrapped(operation, {}, task_id);
    }
    if (!stored) {
        throw ReconciliationError(operation + " failed: task not found", {}, task_id);
    }

    VerificationTask task;
    try {
        task = records::decode_task(stored->value);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CORRUPT_RECORD, key, e.what());
        throw ReconciliationError(operation + " failed: corrupt task record", {}, task_id,
                                  std::current_exception());
    }

    if (task.status != TaskStatus::Pending) {
        throw ReconciliationError(operation + " failed: task is already " + to_string(task.status),
                                  task.entity_iri, task_id);
    }

    if (status == TaskStatus::Approved) {
        store_link(task.entity_iri, *approved_id);
    }

    task.status = status;
    task.approved_id = approved_id;
    try {
        storage_.put(key, records::encode_task(task), stored->generation);
    } catch (const StorageError&) {
        rethrow_wrapped(operation, task.entity_iri, task_id);
    }

    if (status == TaskStatus::Approved) {
        MetricsRegistry::instance().increment_counter("reconcile_tasks_approved_total");
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::TASK_APPROVED,
                         task_id, task.entity_iri + " -> " + *approved_id);
    } else {
        MetricsRegistry::instance().increment_counter("reconcile_tasks_rejected_total");
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::TASK_REJECTED,
                         task_id, task.entity_iri);
    }
}

std::vector<VerificationTask> ReconciliationEngine::get_pending_tasks() {
    std::vector<VerificationTask> pending;
    try {
        for (const auto& key : storage_.list(records::QUEUE_PREFIX)) {
            auto stored = storage_.get(key);
            // Removed between list and get.
            if (!stored) continue;

            try {
                VerificationTask task = records::decode_task(stored->value);
                if (task.status == TaskStatus::Pending) {
                    pending.push_back(std::move(task));
                }
            } catch (const std::exception& e) {
                EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CORRUPT_RECORD,
                                 key, e.what());
            }
        }
    } catch (const StorageError&) {
        rethrow_wrapped("Load pending tasks", {}, {});
    }

    std::stable_sort(pending.begin(), pending.end(),
                     [](const VerificationTask& a, const VerificationTask& b) {
                         return a.created_at_ms < b.created_at_ms;
                     });
    return pending;
}

std::optional<Link> ReconciliationEngine::get_link(const std::string& entity_iri) {
    const std::string key = records::link_key(entity_iri);
    std::optional<StoredValue> stored;
    try {
        stored = storage_.get(key);
    } catch (const StorageError&) {
        rethrow_wrapped("Lookup link", entity_iri, {});
    }
    if (!stored) return std::nullopt;

    try {
        return records::decode_link(stored->value);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CORRUPT_RECORD, key, e.what());
        return std::nullopt;
    }
}

std::optional<VerificationTask> ReconciliationEngine::get_task(const std::string& task_id) {
    const std::string key = records::task_key(task_id);
    std::optional<StoredValue> stored;
    try {
        stored = storage_.get(key);
    } catch (const StorageError&) {
        rethrow_wrapped("Lookup task", {}, task_id);
    }
    if (!stored) return std::nullopt;

    try {
        return records::decode_task(stored->value);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CORRUPT_RECORD, key, e.what());
        return std::nullopt;
    }
}

void ReconciliationEngine::store_link(const std::string& entity_iri, const std::string& external_id) {
    Link link;
    link.entity_iri = entity_iri;
    link.external_id = external_id;
    link.uri = records::entity_uri(external_id);
    link.linked_at_ms = clock_.now_ms();

    try {
        storage_.put(records::link_key(entity_iri), records::encode_link(link));
    } catch (const StorageError&) {
        rethrow_wrapped("Store link", entity_iri, {});
    }
}

ReconciliationResult ReconciliationEngine::record(ReconciliationResult result) {
    MetricsRegistry::instance().increment_counter("reconcile_" + to_string(result.decision) + "_total");

    std::string detail = "label=" + result.label;
    if (result.best_match) {
        detail += " best=" + result.best_match->id + " score=" + std::to_string(result.best_match->score);
    }

    switch (result.decision) {
        case ReconciliationDecision::AutoLinked:
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::AUTO_LINKED,
                             result.entity_iri, detail);
            break;
        case ReconciliationDecision::Queued:
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::TASK_QUEUED,
                             result.entity_iri, detail + " task=" + *result.verification_task_id);
            break;
        case ReconciliationDecision::NoMatch:
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::NO_MATCH,
                             result.entity_iri, detail + " candidates=" + std::to_string(result.candidates.size()));
            break;
        case ReconciliationDecision::Skipped:
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SKIPPED,
                             result.entity_iri, "already linked");
            break;
    }
    return result;
}

}
