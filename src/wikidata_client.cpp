#include "wikidata_client.hpp"
#include "gate_config.hpp"
#include "event_logger.hpp"
#include "idempotency_key.hpp"
#include "input_validator.hpp"
#include "uri_codec.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cctype>
#include <cerrno>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace llmgate {

namespace {

constexpr int64_t DEFAULT_RETRY_AFTER_MS = 60000;
constexpr size_t MAX_RESPONSE_BYTES = 2 * 1024 * 1024;

int64_t parse_retry_after(beast::string_view header) {
    try {
        std::string value(header);
        if (!value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::stoll(value) * 1000;
        }
    } catch (const std::exception&) {}
    // HTTP-date form or garbage: fall back to a conservative minute.
    return DEFAULT_RETRY_AFTER_MS;
}

// Applies the read/write timeout to the blocking socket; Beast's own
// expiry only governs asynchronous operations.
void set_socket_timeouts(tcp::socket& socket, int timeout_sec) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    auto fd = socket.native_handle();
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throw beast::system_error{beast::error_code{errno, boost::system::system_category()}};
    }
}

}

WikidataClient::WikidataClient(const GateConfig& config)
    : host_(config.wikidata_host)
    , port_(config.wikidata_port)
    , path_(config.wikidata_path)
    , user_agent_(config.user_agent)
    , timeout_sec_(config.search_timeout_sec)
{}

std::string WikidataClient::build_target(const std::string& label, const SearchOptions& options) const {
    const std::string language = encode_uri_component(options.language);
    return path_ + "?action=wbsearchentities"
                 + "&search=" + encode_uri_component(label)
                 + "&language=" + language
                 + "&uselang=" + language
                 + "&type=item"
                 + "&limit=" + std::to_string(options.limit)
                 + "&format=json";
}

double WikidataClient::score_hit(const std::string& query, const std::string& label,
                                 const std::string& match_type, size_t rank) {
    double base;
    if (!label.empty() && normalize_text(label) == normalize_text(query)) {
        base = 100.0;
    } else if (match_type == "label") {
        base = 85.0;
    } else if (match_type == "alias") {
        base = 75.0;
    } else {
        base = 60.0;
    }
    // Wikidata orders hits by relevance; later hits lose confidence.
    double penalty = 5.0 * static_cast<double>(rank);
    return std::max(0.0, base - penalty);
}

std::vector<Candidate> WikidataClient::parse_response(const std::string& body,
                                                      const std::string& query,
                                                      uint32_t limit) {
    json::value parsed;
    try {
        parsed = InputValidator::safe_parse_json(body);
    } catch (const std::exception& e) {
        throw SearchApiError(std::string("Malformed wbsearchentities response: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw SearchApiError("Malformed wbsearchentities response: not an object");
    }

    const auto& obj = parsed.as_object();
    if (auto* error = obj.if_contains("error")) {
        std::string code = "unknown";
        std::string info;
        if (error->is_object()) {
            const auto& err = error->as_object();
            if (auto* c = err.if_contains("code"); c && c->is_string()) code = std::string(c->as_string());
            if (auto* i = err.if_contains("info"); i && i->is_string()) info = std::string(i->as_string());
        }
        if (code == "ratelimited" || code == "maxlag") {
            throw SearchRateLimitError("Wikidata throttled the request: " + code, DEFAULT_RETRY_AFTER_MS);
        }
        throw SearchApiError("Wikidata API error " + code + (info.empty() ? "" : ": " + info));
    }

    std::vector<Candidate> candidates;
    auto* hits = obj.if_contains("search");
    if (!hits || !hits->is_array()) return candidates;

    size_t rank = 0;
    for (const auto& hit : hits->as_array()) {
        if (!hit.is_object()) continue;
        const auto& h = hit.as_object();

        auto* id = h.if_contains("id");
        if (!id || !id->is_string()) continue;

        Candidate candidate;
        candidate.id = std::string(id->as_string());
        if (auto* l = h.if_contains("label"); l && l->is_string()) {
            candidate.label = std::string(l->as_string());
        }
        if (auto* d = h.if_contains("description"); d && d->is_string()) {
            candidate.description = std::string(d->as_string());
        }

        std::string match_type;
        if (auto* m = h.if_contains("match"); m && m->is_object()) {
            if (auto* t = m->as_object().if_contains("type"); t && t->is_string()) {
                match_type = std::string(t->as_string());
            }
        }

        candidate.score = score_hit(query, candidate.label, match_type, rank++);
        candidates.push_back(std::move(candidate));
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    if (candidates.size() > limit) candidates.resize(limit);
    return candidates;
}

std::vector<Candidate> WikidataClient::search(const std::string& label, const SearchOptions& options) {
    const std::string target = build_target(label, options);

    http::response<http::string_body> res;
    try {
        net::io_context ioc;
        ssl::context ctx{ssl::context::tlsv12_client};
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        tcp::resolver resolver(ioc);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        // SNI is required by the Wikimedia edge.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }
        stream.set_verify_callback(ssl::host_name_verification(host_));

        auto const results = resolver.resolve(host_, port_);
        beast::get_lowest_layer(stream).connect(results);
        set_socket_timeouts(beast::get_lowest_layer(stream).socket(), timeout_sec_);
        stream.handshake(ssl::stream_base::client);

        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, user_agent_);
        req.set(http::field::accept, "application/json");
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(MAX_RESPONSE_BYTES);
        http::read(stream, buffer, parser);
        res = parser.release();

        beast::error_code ec;
        stream.shutdown(ec);
        // Servers commonly skip close_notify; a truncated shutdown is harmless here.
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::REGISTRY_FAILURE,
                             host_, "TLS shutdown: " + ec.message());
        }
    } catch (const beast::system_error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::REGISTRY_FAILURE,
                         host_, e.what());
        throw SearchApiError(std::string("Wikidata request failed: ") + e.what());
    }

    const int status = static_cast<int>(res.result_int());
    if (res.result() == http::status::too_many_requests) {
        int64_t retry_after = parse_retry_after(res[http::field::retry_after]);
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::REGISTRY_FAILURE,
                         host_, "throttled, retry_after_ms=" + std::to_string(retry_after));
        throw SearchRateLimitError("Wikidata rate limit exceeded", retry_after);
    }
    if (status < 200 || status >= 300) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::REGISTRY_FAILURE,
                         host_, "HTTP " + std::to_string(status));
        throw SearchApiError("Wikidata returned HTTP " + std::to_string(status), status);
    }

    return parse_response(res.body(), label, options.limit);
}

}
