#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/json.hpp>

#include "candidate_search.hpp"
#include "clock.hpp"
#include "gate_config.hpp"
#include "key_value_storage.hpp"

namespace llmgate {

enum class ReconciliationDecision {
    AutoLinked,
    Queued,
    NoMatch,
    Skipped
};

enum class TaskStatus {
    Pending,
    Approved,
    Rejected
};

// "auto_linked", "queued", "no_match", "skipped"
std::string to_string(ReconciliationDecision decision);
// "pending", "approved", "rejected"
std::string to_string(TaskStatus status);
std::optional<TaskStatus> parse_task_status(const std::string& text);

// Human review item for a match that was neither confident nor hopeless.
struct VerificationTask {
    std::string id;
    std::string entity_iri;
    std::string label;
    std::vector<Candidate> candidates;
    int64_t created_at_ms = 0;
    TaskStatus status = TaskStatus::Pending;
    std::optional<std::string> approved_id;
};

// Persisted entity -> registry identifier mapping.
struct Link {
    std::string entity_iri;
    std::string external_id;
    std::string uri;
    int64_t linked_at_ms = 0;
};

struct ReconciliationResult {
    std::string entity_iri;
    std::string label;
    ReconciliationDecision decision = ReconciliationDecision::NoMatch;
    std::vector<Candidate> candidates;
    std::optional<Candidate> best_match;
    std::optional<std::string> verification_task_id;
};

struct EntityRef {
    std::string iri;
    std::string label;
    std::vector<std::string> types;
};

/**
 * Storage failure during reconciliation. Carries the entity or task the
 * operation concerned and the underlying storage exception.
 */
class ReconciliationError : public std::runtime_error {
public:
    ReconciliationError(const std::string& message,
                        std::string entity_iri,
                        std::string task_id = {},
                        std::exception_ptr cause = nullptr);

    const std::string& entity_iri() const { return entity_iri_; }
    const std::string& task_id() const { return task_id_; }
    std::exception_ptr cause() const { return cause_; }

private:
    std::string entity_iri_;
    std::string task_id_;
    std::exception_ptr cause_;
};

// JSON codec for the persisted records.
namespace records {

inline const std::string LINKS_PREFIX = "links/";
inline const std::string QUEUE_PREFIX = "queue/";

std::string link_key(const std::string& entity_iri);
std::string task_key(const std::string& task_id);
std::string entity_uri(const std::string& external_id);

boost::json::object encode_candidate(const Candidate& candidate);
Candidate decode_candidate(const boost::json::value& value);

std::string encode_task(const VerificationTask& task);
// Throws std::invalid_argument (or a Boost.JSON error) on a malformed record.
VerificationTask decode_task(const std::string& json);

std::string encode_link(const Link& link);
Link decode_link(const std::string& json);

}

/**
 * Decides, per entity, whether a registry match is confident enough to link
 * automatically, needs a human reviewer, or is absent, and runs the durable
 * review workflow.
 *
 * Search errors propagate unchanged; storage errors are wrapped in
 * ReconciliationError.
 */
class ReconciliationEngine {
public:
    ReconciliationEngine(KeyValueStorage& storage,
                         CandidateSearchClient& search,
                         const Clock& clock);

    ReconciliationResult reconcile_entity(const std::string& entity_iri,
                                          const std::string& label,
                                          const std::vector<std::string>& types,
                                          const ReconciliationConfig& config = {});

    // Entities are processed one after another, in input order.
    std::vector<ReconciliationResult> reconcile_batch(const std::vector<EntityRef>& entities,
                                                      const ReconciliationConfig& config = {});

    std::string queue_for_verification(const std::string& entity_iri,
                                       const std::string& label,
                                       const std::vector<Candidate>& candidates);

    void approve_task(const std::string& task_id, const std::string& chosen_id);
    void reject_task(const std::string& task_id);

    // Pending tasks, oldest first. Records that fail to decode are skipped.
    std::vector<VerificationTask> get_pending_tasks();

    std::optional<Link> get_link(const std::string& entity_iri);

    // Any task regardless of status.
    std::optional<VerificationTask> get_task(const std::string& task_id);

private:
    void store_link(const std::string& entity_iri, const std::string& external_id);
    void finish_task(const std::string& task_id, TaskStatus status,
                     const std::optional<std::string>& approved_id,
                     const std::string& operation);
    ReconciliationResult record(ReconciliationResult result);

    KeyValueStorage& storage_;
    CandidateSearchClient& search_;
    const Clock& clock_;
};

}
