#pragma once

#include <map>
#include <mutex>
#include <string>

namespace datalens::metrics {

// Process-wide registry. Counter and histogram keys carry their labels in
// Prometheus form, e.g. analysis_runs_total{route="ml"}.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void Increment(const std::string& name, const std::map<std::string, std::string>& labels, long value = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[SerializeKey(name, labels)] += value;
    }

    void SetGauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void RecordLatency(const std::string& name, const std::map<std::string, std::string>& labels, double ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& h = histograms_[SerializeKey(name, labels)];
        h.count++;
        h.sum += ms;
        if (ms < h.min) h.min = ms;
        if (ms > h.max) h.max = ms;
    }

    long GetCounter(const std::string& name, const std::map<std::string, std::string>& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(SerializeKey(name, labels));
        return it == counters_.end() ? 0 : it->second;
    }

    struct HistogramStats {
        long count = 0;
        double sum = 0.0;
        double min = 1e9;
        double max = 0.0;
    };

    std::string ToPrometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& kv : counters_) {
            out += kv.first + " " + std::to_string(kv.second) + "\n";
        }
        for (const auto& kv : gauges_) {
            out += kv.first + " " + std::to_string(kv.second) + "\n";
        }
        for (const auto& kv : histograms_) {
            auto brace = kv.first.find('{');
            std::string base = kv.first.substr(0, brace);
            std::string labels = brace == std::string::npos ? "" : kv.first.substr(brace);
            out += base + "_count" + labels + " " + std::to_string(kv.second.count) + "\n";
            out += base + "_sum" + labels + " " + std::to_string(kv.second.sum) + "\n";
            out += base + "_max" + labels + " " + std::to_string(kv.second.max) + "\n";
        }
        return out;
    }

private:
    MetricsRegistry() = default;
    std::mutex mutex_;
    std::map<std::string, long> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, HistogramStats> histograms_;

    static std::string SerializeKey(const std::string& name, const std::map<std::string, std::string>& labels) {
        if (labels.empty()) return name;
        std::string key = name + "{";
        bool first = true;
        for (const auto& lp : labels) {
            if (!first) key += ",";
            key += lp.first + "=\"" + lp.second + "\"";
            first = false;
        }
        key += "}";
        return key;
    }
};

} // namespace datalens::metrics
