#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace llmgate {

// Input validation for identifiers and records read back from storage.
class InputValidator {
public:
    // Lowercase base36, the alphabet of task id segments.
    static bool is_base36(const std::string& str) {
        if (str.empty()) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
        });
    }

    // "task-<base36 timestamp>-<6 base36 chars>"
    static bool is_valid_task_id(const std::string& id) {
        const std::string prefix = "task-";
        if (id.size() <= prefix.size() + 7 || id.compare(0, prefix.size(), prefix) != 0) return false;
        auto dash = id.rfind('-');
        if (dash <= prefix.size()) return false;
        return is_base36(id.substr(prefix.size(), dash - prefix.size()))
            && id.size() - dash - 1 == 6
            && is_base36(id.substr(dash + 1));
    }

    // Wikidata item identifier, e.g. "Q42".
    static bool is_valid_entity_id(const std::string& id) {
        if (id.size() < 2 || id[0] != 'Q' || id[1] == '0') return false;
        return std::all_of(id.begin() + 1, id.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        });
    }

    /**
     * JSON parsing with a recursion depth limit so that hostile or corrupted
     * documents cannot exhaust the stack.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
