#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmgate {

// A ranked registry match for an entity label.
struct Candidate {
    std::string id;                          // Registry identifier, e.g. "Q312"
    double score = 0.0;                      // Confidence 0-100
    std::string label;
    std::optional<std::string> description;
};

struct SearchOptions {
    std::string language = "en";
    uint32_t limit = 5;
    std::vector<std::string> types;          // Entity type IRIs, a hint only
};

// Base of every failure reported by a registry client.
class SearchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The registry throttled us; retry no sooner than retry_after_ms.
class SearchRateLimitError : public SearchError {
public:
    SearchRateLimitError(const std::string& message, int64_t retry_after_ms)
        : SearchError(message), retry_after_ms_(retry_after_ms) {}

    int64_t retry_after_ms() const { return retry_after_ms_; }

private:
    int64_t retry_after_ms_;
};

// Transport failure, unexpected status or an unreadable response body.
class SearchApiError : public SearchError {
public:
    SearchApiError(const std::string& message, int status_code = 0)
        : SearchError(message), status_code_(status_code) {}

    // HTTP status, or 0 when the request never produced one.
    int status_code() const { return status_code_; }

private:
    int status_code_;
};

// Search side of the external registry.
class CandidateSearchClient {
public:
    virtual ~CandidateSearchClient() = default;

    /**
     * Looks up candidates for a label.
     * @return At most options.limit candidates, best match first.
     * @throws SearchRateLimitError, SearchApiError
     */
    virtual std::vector<Candidate> search(const std::string& label, const SearchOptions& options) = 0;
};

}
