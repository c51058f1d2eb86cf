#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/metrics.h — RED metrics registry, Prometheus text exposition
// ═══════════════════════════════════════════════════════════════════
//
//  metrics::Registry registry;
//  registry.recordRequest("GET", "/health", 200);
//  registry.observeLatency("GET", "/health", 0.0031);
//  registry.setUptime(12.5);
//  res.type(metrics::Registry::contentType()).send(registry.exportText());
//
//  Every family guards its own series with a mutex, so increments
//  from concurrent requests are never lost.
//
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace pilot::metrics {

// Label values, in the order of the family's label names
using Labels = std::vector<std::string>;

// ── Number rendering used by the exposition format ──
//    1 -> "1.0", 0.005 -> "0.005", inf -> "+Inf"
std::string formatValue(double value);

// ── Escape \, " and newline inside a label value ──
std::string escapeLabelValue(const std::string& value);

// ═══════════════════════════════════════════
//  CounterFamily — monotonic counters keyed by label values
// ═══════════════════════════════════════════
class CounterFamily {
public:
    CounterFamily(std::string name, std::string help, std::vector<std::string> labelNames);

    // Throws std::invalid_argument on a label count mismatch or a negative amount
    void inc(const Labels& labels, double amount = 1.0);

    double value(const Labels& labels) const;

    void write(std::ostream& out) const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::string help_;
    std::vector<std::string> labelNames_;

    mutable std::mutex mutex_;
    std::map<Labels, double> series_;
};

// ═══════════════════════════════════════════
//  HistogramFamily — bucketed observations keyed by label values
// ═══════════════════════════════════════════
class HistogramFamily {
public:
    // `buckets` are upper bounds and must be strictly ascending;
    // the +Inf bucket is implicit.
    HistogramFamily(std::string name, std::string help,
                    std::vector<std::string> labelNames,
                    std::vector<double> buckets);

    void observe(const Labels& labels, double value);

    std::uint64_t count(const Labels& labels) const;
    double sum(const Labels& labels) const;

    // One entry per bound plus the trailing +Inf entry
    std::vector<std::uint64_t> cumulativeCounts(const Labels& labels) const;

    const std::vector<double>& buckets() const { return buckets_; }

    void write(std::ostream& out) const;

    const std::string& name() const { return name_; }

private:
    struct Series {
        std::vector<std::uint64_t> counts;   // per bucket, not cumulative
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    std::string name_;
    std::string help_;
    std::vector<std::string> labelNames_;
    std::vector<double> buckets_;

    mutable std::mutex mutex_;
    std::map<Labels, Series> series_;
};

// ═══════════════════════════════════════════
//  Gauge — a single unlabeled value
// ═══════════════════════════════════════════
class Gauge {
public:
    Gauge(std::string name, std::string help);

    void set(double value);
    double value() const;

    void write(std::ostream& out) const;

private:
    std::string name_;
    std::string help_;

    mutable std::mutex mutex_;
    double value_ = 0.0;
};

// ═══════════════════════════════════════════
//  Process collector — process_* metrics sampled from /proc/self.
//  Writes nothing where /proc is unavailable.
// ═══════════════════════════════════════════
void writeProcessMetrics(std::ostream& out);

// ═══════════════════════════════════════════
//  Registry — the service's metric families
// ═══════════════════════════════════════════
class Registry {
public:
    static constexpr const char* kRequestsTotal   = "http_requests_total";
    static constexpr const char* kRequestDuration = "http_request_duration_seconds";
    static constexpr const char* kUptime          = "app_uptime_seconds";

    static const std::vector<double>& latencyBuckets();
    static const char* contentType();

    explicit Registry(bool processMetrics = true);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void recordRequest(const std::string& method, const std::string& endpoint, int statusCode);
    void observeLatency(const std::string& method, const std::string& endpoint, double seconds);
    void setUptime(double seconds);

    // Full exposition: process metrics (if enabled), then requests,
    // latency and uptime families.
    std::string exportText() const;

    // ── Read accessors ──
    double requestCount(const std::string& method, const std::string& endpoint,
                        int statusCode) const;
    std::uint64_t latencyCount(const std::string& method, const std::string& endpoint) const;
    const HistogramFamily& latency() const { return latency_; }
    double uptime() const { return uptime_.value(); }

private:
    bool processMetrics_;
    CounterFamily requests_;
    HistogramFamily latency_;
    Gauge uptime_;
};

} // namespace pilot::metrics
