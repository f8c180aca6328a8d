#pragma once

#include <string>
#include <vector>
#include <boost/json.hpp>

#include "candidate_search.hpp"

namespace llmgate {

struct GateConfig;

// Candidate search against the Wikidata wbsearchentities API over HTTPS.
// wbsearchentities does not score its hits, so a 0-100 confidence is
// derived from how each hit matched the query and from its rank.
class WikidataClient : public CandidateSearchClient {
public:
    explicit WikidataClient(const GateConfig& config);

    std::vector<Candidate> search(const std::string& label, const SearchOptions& options) override;

    // Request target (path + query string) for a search.
    std::string build_target(const std::string& label, const SearchOptions& options) const;

    /**
     * Turns a wbsearchentities response body into candidates.
     * @throws SearchRateLimitError when the API reports throttling in-band.
     * @throws SearchApiError on malformed JSON or an API error object.
     */
    static std::vector<Candidate> parse_response(const std::string& body,
                                                 const std::string& query,
                                                 uint32_t limit);

    /**
     * Confidence for one hit.
     * @param match_type "label", "alias" or another wbsearchentities match type.
     * @param rank Zero-based position in the API's result list.
     */
    static double score_hit(const std::string& query, const std::string& label,
                            const std::string& match_type, size_t rank);

private:
    std::string host_;
    std::string port_;
    std::string path_;
    std::string user_agent_;
    int timeout_sec_;
};

}
