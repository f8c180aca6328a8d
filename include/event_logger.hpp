#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <ctime>

namespace llmgate {

// Logs governance and reconciliation events, one line per event.
class EventLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        RATE_LIMITED,
        CIRCUIT_REJECTED,
        CIRCUIT_OPENED,
        CIRCUIT_HALF_OPEN,
        CIRCUIT_CLOSED,
        CIRCUIT_FORCED,
        RELEASE_FAILED,
        AUTO_LINKED,
        TASK_QUEUED,
        NO_MATCH,
        SKIPPED,
        TASK_APPROVED,
        TASK_REJECTED,
        CORRUPT_RECORD,
        STORAGE_FAILURE,
        REGISTRY_FAILURE,
        CONFIG
    };

    /**
     * Records an event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param context Subject of the event (entity IRI, task id, "governor"...).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& context,
                   const std::string& message = "") {
        std::string line = format(level, event, context, message);

        // Log to appropriate destination based on severity
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    static std::string format(Level level, EventType event, const std::string& context,
                              const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ctx=" << (context.empty() ? std::string("-") : sanitize_log_message(context));

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::RATE_LIMITED: return "RATE_LIMIT";
            case EventType::CIRCUIT_REJECTED: return "CIRCUIT_REJECT";
            case EventType::CIRCUIT_OPENED: return "CIRCUIT_OPEN";
            case EventType::CIRCUIT_HALF_OPEN: return "CIRCUIT_HALF_OPEN";
            case EventType::CIRCUIT_CLOSED: return "CIRCUIT_CLOSED";
            case EventType::CIRCUIT_FORCED: return "CIRCUIT_FORCED";
            case EventType::RELEASE_FAILED: return "RELEASE_FAILED";
            case EventType::AUTO_LINKED: return "AUTO_LINKED";
            case EventType::TASK_QUEUED: return "QUEUED";
            case EventType::NO_MATCH: return "NO_MATCH";
            case EventType::SKIPPED: return "SKIPPED";
            case EventType::TASK_APPROVED: return "APPROVED";
            case EventType::TASK_REJECTED: return "REJECTED";
            case EventType::CORRUPT_RECORD: return "CORRUPT_RECORD";
            case EventType::STORAGE_FAILURE: return "STORAGE";
            case EventType::REGISTRY_FAILURE: return "REGISTRY";
            case EventType::CONFIG: return "CONFIG";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
