#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "gate_config.hpp"
#include "clock.hpp"
#include "idempotency_key.hpp"
#include "input_validator.hpp"
#include "memory_storage.hpp"
#include "redis_storage.hpp"
#include "reconciliation_engine.hpp"
#include "wikidata_client.hpp"
#include "event_logger.hpp"

namespace llmgate {

namespace {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> [args]\n"
              << "Commands:\n"
              << "  key <text> <ontology-id> <ontology-file> [name=json ...]\n"
              << "                                   Derive the idempotency key for a unit of work\n"
              << "  ontology-version <file>          Content hash of an ontology document\n"
              << "  reconcile <entity-iri> <label> [type ...]\n"
              << "                                   Reconcile one entity against Wikidata\n"
              << "  batch <file>                     Reconcile iri<TAB>label[<TAB>type,...] lines\n"
              << "  pending                          List pending verification tasks\n"
              << "  approve <task-id> <external-id>  Approve a task and link the entity\n"
              << "  reject <task-id>                 Reject a task\n"
              << "  link <entity-iri>                Show the stored link for an entity\n"
              << "Options:\n"
              << "  --help, -h                       Show this help\n"
              << "Environment: LLMGATE_STORAGE (memory|redis), LLMGATE_REDIS_URL, LLMGATE_*\n"
              << "pending, approve, reject and link require LLMGATE_STORAGE=redis.\n";
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void require_args(const std::vector<std::string>& args, size_t count, const std::string& command) {
    if (args.size() < count) {
        throw UsageError("'" + command + "' expects at least " + std::to_string(count) + " argument(s)");
    }
}

std::vector<std::string> split(const std::string& input, char sep) {
    std::vector<std::string> parts;
    std::string current;
    std::stringstream ss(input);
    while (std::getline(ss, current, sep)) {
        if (!current.empty()) parts.push_back(current);
    }
    return parts;
}

ParamList parse_params(const std::vector<std::string>& args, size_t from) {
    ParamList params;
    for (size_t i = from; i < args.size(); ++i) {
        auto eq = args[i].find('=');
        if (eq == std::string::npos || eq == 0) {
            throw UsageError("Parameter must be name=json: '" + args[i] + "'");
        }
        std::string name = args[i].substr(0, eq);
        try {
            params.emplace_back(name, InputValidator::safe_parse_json(args[i].substr(eq + 1)));
        } catch (const boost::system::system_error& e) {
            throw UsageError("Parameter '" + name + "' is not valid JSON: " + e.what());
        }
    }
    return params;
}

void print_candidates(const std::vector<Candidate>& candidates) {
    for (const auto& c : candidates) {
        std::cout << "    " << c.id << "  " << c.score << "  " << c.label;
        if (c.description) std::cout << " (" << *c.description << ")";
        std::cout << "\n";
    }
}

void print_result(const ReconciliationResult& result) {
    std::cout << result.entity_iri << "\t" << to_string(result.decision);
    if (result.best_match) {
        std::cout << "\t" << result.best_match->id << "\t" << result.best_match->score;
    }
    if (result.verification_task_id) {
        std::cout << "\ttask=" << *result.verification_task_id;
    }
    std::cout << "\n";
    print_candidates(result.candidates);
}

std::unique_ptr<KeyValueStorage> open_storage(const GateConfig& config, const Clock& clock) {
    if (config.storage_backend == "redis") {
        auto redis = std::make_unique<RedisStorage>(config, clock);
        if (!redis->is_connected()) {
            throw std::runtime_error("Redis storage unavailable at " + config.redis_url);
        }
        return redis;
    }
    std::cout << "[*] Using in-memory storage; links and tasks are lost on exit.\n";
    return std::make_unique<MemoryStorage>(clock);
}

int run_command(const std::string& command, const std::vector<std::string>& args, const GateConfig& config) {
    if (command == "key") {
        require_args(args, 3, command);
        std::string version = ontology_version(read_file(args[2]));
        std::string key = compute_key(args[0], args[1], version, parse_params(args, 3));
        std::cout << key << "\n" << short_key(key) << "\n";
        return 0;
    }
    if (command == "ontology-version") {
        require_args(args, 1, command);
        std::cout << ontology_version(read_file(args[0])) << "\n";
        return 0;
    }

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::CONFIG, "llmgate",
                     "storage=" + config.storage_backend +
                     " auto_link=" + std::to_string(config.reconciliation.auto_link_threshold) +
                     " queue=" + std::to_string(config.reconciliation.queue_threshold));

    // Review commands read what earlier runs stored; an in-memory store is always empty.
    const bool review_command = command == "pending" || command == "approve" ||
                                command == "reject" || command == "link";
    if (review_command && !has_durable_storage(config)) {
        throw UsageError("'" + command + "' needs persistent storage; set LLMGATE_STORAGE=redis");
    }
    if (command == "approve" || command == "reject") {
        require_args(args, command == "approve" ? 2 : 1, command);
        if (!InputValidator::is_valid_task_id(args[0])) {
            throw UsageError("Malformed task id '" + args[0] + "'");
        }
        if (command == "approve" && !InputValidator::is_valid_entity_id(args[1])) {
            throw UsageError("Malformed Wikidata item id '" + args[1] + "' (expected Q<digits>)");
        }
    }

    SystemClock clock;
    auto storage = open_storage(config, clock);
    WikidataClient wikidata(config);
    ReconciliationEngine engine(*storage, wikidata, clock);

    if (command == "reconcile") {
        require_args(args, 2, command);
        std::vector<std::string> types(args.begin() + 2, args.end());
        print_result(engine.reconcile_entity(args[0], args[1], types, config.reconciliation));
    } else if (command == "batch") {
        require_args(args, 1, command);
        std::vector<EntityRef> entities;
        std::stringstream lines(read_file(args[0]));
        std::string line;
        size_t line_no = 0;
        while (std::getline(lines, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;

            auto first = line.find('\t');
            if (first == std::string::npos) {
                throw UsageError(args[0] + ":" + std::to_string(line_no) + ": expected iri<TAB>label");
            }
            EntityRef entity;
            entity.iri = line.substr(0, first);
            auto second = line.find('\t', first + 1);
            entity.label = line.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
            if (second != std::string::npos) {
                entity.types = split(line.substr(second + 1), ',');
            }
            entities.push_back(std::move(entity));
        }
        for (const auto& result : engine.reconcile_batch(entities, config.reconciliation)) {
            print_result(result);
        }
    } else if (command == "pending") {
        auto tasks = engine.get_pending_tasks();
        std::cout << "[*] " << tasks.size() << " pending task(s)\n";
        for (const auto& task : tasks) {
            std::cout << task.id << "\t" << task.entity_iri << "\t" << task.label << "\n";
            print_candidates(task.candidates);
        }
    } else if (command == "approve") {
        require_args(args, 2, command);
        engine.approve_task(args[0], args[1]);
        std::cout << "[*] Approved " << args[0] << " -> " << args[1] << "\n";
    } else if (command == "reject") {
        require_args(args, 1, command);
        engine.reject_task(args[0]);
        std::cout << "[*] Rejected " << args[0] << "\n";
    } else if (command == "link") {
        require_args(args, 1, command);
        auto link = engine.get_link(args[0]);
        if (!link) {
            std::cout << "[*] No link for " << args[0] << "\n";
            return 1;
        }
        std::cout << link->entity_iri << "\t" << link->external_id << "\t" << link->uri << "\n";
    } else {
        throw UsageError("Unknown command '" + command + "'");
    }
    return 0;
}

}

}

int main(int argc, char* argv[]) {
    try {
        llmgate::GateConfig config;

        // --- CLI Argument Parsing ---
        std::string command;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                llmgate::print_usage(argv[0]);
                return 0;
            } else if (command.empty()) {
                command = arg;
            } else {
                args.push_back(arg);
            }
        }
        if (command.empty()) {
            llmgate::print_usage(argv[0]);
            return 2;
        }

        // --- Environment Variable Overrides ---
        llmgate::apply_env_overrides(config);
        llmgate::validate_config(config);

        return llmgate::run_command(command, args, config);

    } catch (const llmgate::UsageError& e) {
        std::cerr << "[!] " << e.what() << "\n";
        std::cerr << "[*] Run '" << argv[0] << " --help' for usage.\n";
        return 2;
    } catch (const llmgate::SearchRateLimitError& e) {
        std::cerr << "[!] " << e.what() << " (retry after " << e.retry_after_ms() << " ms)\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
