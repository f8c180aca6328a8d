#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/json.hpp>

namespace llmgate {

// Call parameters that take part in the key. An empty optional marks a field
// that is present but undefined; such fields are ignored. JSON null counts.
using ParamList = std::vector<std::pair<std::string, std::optional<boost::json::value>>>;

// Digest returned by hash_params() for an empty parameter set.
inline const std::string EMPTY_PARAMS_DIGEST(16, '0');

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(const std::string& data);

// Trims, lowercases and collapses every whitespace run to a single space.
// Works on UTF-8 code points: Unicode case mapping, and NBSP, U+2028, U+3000
// and the other Unicode spaces count as whitespace. Invalid bytes are dropped.
std::string normalize_text(const std::string& text);

// JSON text of `value` with numbers in the JavaScript number format
// (0.7, 1, 1e+21), independent of the JSON library's own serializer.
std::string canonical_json(const boost::json::value& value);

/**
 * Order-independent 16-hex digest of the call parameters.
 * Fields are sorted by name and joined as "name:json" with '|'.
 */
std::string hash_params(const ParamList& params);
std::string hash_params(const boost::json::object& params);

/**
 * Derives the idempotency key shared by the cache, the work queue and the
 * storage layout for one unit of work.
 * @param text Source text; case and whitespace do not matter.
 * @param ontology_id Ontology identity (e.g. "foaf").
 * @param ontology_version Content hash of the ontology, see ontology_version().
 * @param params Call parameters.
 * @return 64-character lowercase hex key.
 */
std::string compute_key(const std::string& text,
                        const std::string& ontology_id,
                        const std::string& ontology_version,
                        const ParamList& params);
std::string compute_key(const std::string& text,
                        const std::string& ontology_id,
                        const std::string& ontology_version,
                        const boost::json::object& params = {});

// Content address of an ontology document; any edit yields a new version.
std::string ontology_version(const std::string& ontology_content);

// First 12 characters of a key. For display only, never for comparison.
std::string short_key(const std::string& key);

// True for a 64-character lowercase hex string.
bool is_idempotency_key(const std::string& candidate);

}
