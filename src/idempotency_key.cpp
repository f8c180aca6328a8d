#include "idempotency_key.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <boost/locale.hpp>
#include <openssl/sha.h>

namespace llmgate {

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

namespace {

// ECMAScript WhiteSpace and LineTerminator code points, the set matched by
// JavaScript trim() and \s.
bool is_unicode_space(char32_t cp) {
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0xA0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

const std::locale& utf8_locale() {
    static const std::locale loc = boost::locale::generator()("en_US.UTF-8");
    return loc;
}

// Shortest round-trip rendering laid out like Number.prototype.toString:
// plain digits for exponents in [-7, 21), scientific "1e+21" style beyond.
std::string format_double(double value) {
    if (!std::isfinite(value)) return "null";
    if (value == 0.0) return "0";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), std::abs(value), std::chars_format::scientific);
    if (ec != std::errc()) {
        throw std::runtime_error("Cannot render number: " + std::make_error_code(ec).message());
    }
    std::string sci(buf, end);

    auto e_pos = sci.find('e');
    std::string digits = sci.substr(0, e_pos);
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    const int k = static_cast<int>(digits.size());
    // value = 0.d1d2...dk * 10^n
    const int n = std::stoi(sci.substr(e_pos + 1)) + 1;

    std::string out = value < 0 ? "-" : "";
    if (k <= n && n <= 21) {
        out += digits + std::string(n - k, '0');
    } else if (0 < n && n <= 21) {
        out += digits.substr(0, n) + "." + digits.substr(n);
    } else if (-6 < n && n <= 0) {
        out += "0." + std::string(-n, '0') + digits;
    } else {
        out += digits.substr(0, 1);
        if (k > 1) out += "." + digits.substr(1);
        out += (n - 1 >= 0 ? "e+" : "e-") + std::to_string(std::abs(n - 1));
    }
    return out;
}

void write_canonical(const boost::json::value& value, std::string& out) {
    switch (value.kind()) {
        case boost::json::kind::null:
            out += "null";
            break;
        case boost::json::kind::bool_:
            out += value.get_bool() ? "true" : "false";
            break;
        case boost::json::kind::int64:
            out += std::to_string(value.get_int64());
            break;
        case boost::json::kind::uint64:
            out += std::to_string(value.get_uint64());
            break;
        case boost::json::kind::double_:
            out += format_double(value.get_double());
            break;
        case boost::json::kind::string:
            out += boost::json::serialize(value);
            break;
        case boost::json::kind::array: {
            out += '[';
            bool first = true;
            for (const auto& element : value.get_array()) {
                if (!first) out += ',';
                first = false;
                write_canonical(element, out);
            }
            out += ']';
            break;
        }
        case boost::json::kind::object: {
            out += '{';
            bool first = true;
            for (const auto& field : value.get_object()) {
                if (!first) out += ',';
                first = false;
                out += boost::json::serialize(boost::json::value(field.key()));
                out += ':';
                write_canonical(field.value(), out);
            }
            out += '}';
            break;
        }
    }
}

}

std::string normalize_text(const std::string& text) {
    const std::string lowered = boost::locale::to_lower(text, utf8_locale());
    const std::u32string code_points = boost::locale::conv::utf_to_utf<char32_t>(lowered);

    std::u32string result;
    result.reserve(code_points.size());

    bool pending_space = false;
    for (char32_t cp : code_points) {
        if (is_unicode_space(cp)) {
            // Leading whitespace never emits a separator.
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += U' ';
            pending_space = false;
        }
        result += cp;
    }
    return boost::locale::conv::utf_to_utf<char>(result);
}

std::string canonical_json(const boost::json::value& value) {
    std::string out;
    write_canonical(value, out);
    return out;
}

std::string hash_params(const ParamList& params) {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.reserve(params.size());
    for (const auto& [name, value] : params) {
        if (!value) continue;
        fields.emplace_back(name, canonical_json(*value));
    }

    if (fields.empty()) return EMPTY_PARAMS_DIGEST;

    // Sorting whole pairs keeps repeated names deterministic too.
    std::sort(fields.begin(), fields.end());

    std::string canonical;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) canonical += '|';
        canonical += fields[i].first;
        canonical += ':';
        canonical += fields[i].second;
    }
    return sha256_hex(canonical).substr(0, 16);
}

std::string hash_params(const boost::json::object& params) {
    ParamList list;
    list.reserve(params.size());
    for (const auto& field : params) {
        list.emplace_back(std::string(field.key()), field.value());
    }
    return hash_params(list);
}

std::string compute_key(const std::string& text,
                        const std::string& ontology_id,
                        const std::string& ontology_version,
                        const ParamList& params) {
    return sha256_hex(normalize_text(text) + "|" + ontology_id + "|" +
                      ontology_version + "|" + hash_params(params));
}

std::string compute_key(const std::string& text,
                        const std::string& ontology_id,
                        const std::string& ontology_version,
                        const boost::json::object& params) {
    return sha256_hex(normalize_text(text) + "|" + ontology_id + "|" +
                      ontology_version + "|" + hash_params(params));
}

std::string ontology_version(const std::string& ontology_content) {
    return sha256_hex(ontology_content);
}

std::string short_key(const std::string& key) {
    return key.substr(0, 12);
}

bool is_idempotency_key(const std::string& candidate) {
    if (candidate.size() != 64) return false;
    return std::all_of(candidate.begin(), candidate.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

}
