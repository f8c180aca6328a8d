#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace llmgate {

// Process-wide counters and gauges for the governor and the reconciliation
// engine, exported in Prometheus text format by governor_bench.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry registry;
        return registry;
    }

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    // Counters only grow, e.g. governor_acquired_total or reconcile_queued_total.
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        increment_gauge(name, -value);
    }

    // Unrecorded series read as zero.
    double get_counter(const std::string& name) const {
        return lookup(counters_, name);
    }

    double get_gauge(const std::string& name) const {
        return lookup(gauges_, name);
    }

    /**
     * Text exposition format 0.0.4, counters first, each block sorted by name.
     */
    std::string collect_prometheus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;
        write_block(ss, counters_, "counter");
        write_block(ss, gauges_, "gauge");
        return ss.str();
    }

    // Drops every recorded series. Used between test cases.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

private:
    MetricsRegistry() = default;

    double lookup(const std::map<std::string, double>& series, const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series.find(name);
        return it != series.end() ? it->second : 0.0;
    }

    static void write_block(std::stringstream& ss, const std::map<std::string, double>& series,
                            const char* type) {
        for (const auto& [name, value] : series) {
            ss << "# TYPE " << name << " " << type << "\n";
            ss << name << " " << value << "\n";
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    mutable std::mutex mutex_;
};

}
