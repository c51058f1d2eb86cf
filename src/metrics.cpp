// ═══════════════════════════════════════════════════════════════════
//  src/metrics.cpp — Metric families and the exposition writer
// ═══════════════════════════════════════════════════════════════════

#include "pilot/metrics.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>

#ifdef __linux__
#include <sys/resource.h>
#include <unistd.h>
#endif

namespace pilot::metrics {

namespace {

std::string escapeHelp(const std::string& help) {
    std::string out;
    out.reserve(help.size());
    for (char c : help) {
        if (c == '\\')      out += "\\\\";
        else if (c == '\n') out += "\\n";
        else                out += c;
    }
    return out;
}

void writeHeader(std::ostream& out, const std::string& name,
                 const std::string& help, const char* type) {
    out << "# HELP " << name << ' ' << escapeHelp(help) << '\n'
        << "# TYPE " << name << ' ' << type << '\n';
}

// {a="x",b="y"[,extra="z"]}, or nothing for an empty set
std::string labelSet(const std::vector<std::string>& names, const Labels& values,
                     const char* extraName = nullptr, const std::string& extraValue = "") {
    std::string out;
    bool first = true;
    auto append = [&](const std::string& name, const std::string& value) {
        out += first ? "{" : ",";
        first = false;
        out += name;
        out += "=\"";
        out += escapeLabelValue(value);
        out += '"';
    };
    for (std::size_t i = 0; i < names.size(); ++i) {
        append(names[i], values[i]);
    }
    if (extraName) {
        append(extraName, extraValue);
    }
    if (!first) out += '}';
    return out;
}

void checkArity(const std::string& family, const std::vector<std::string>& names,
                const Labels& values) {
    if (names.size() != values.size()) {
        throw std::invalid_argument(family + ": expected " + std::to_string(names.size()) +
                                    " label values, got " + std::to_string(values.size()));
    }
}

} // namespace

// ═══════════════════════════════════════════
//  Formatting
// ═══════════════════════════════════════════

std::string formatValue(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

    if (value == std::floor(value) && std::fabs(value) < 1e16) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", value);
        return buf;
    }

    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
}

std::string escapeLabelValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;
        }
    }
    return out;
}

// ═══════════════════════════════════════════
//  CounterFamily
// ═══════════════════════════════════════════

CounterFamily::CounterFamily(std::string name, std::string help,
                             std::vector<std::string> labelNames)
    : name_(std::move(name))
    , help_(std::move(help))
    , labelNames_(std::move(labelNames))
{}

void CounterFamily::inc(const Labels& labels, double amount) {
    checkArity(name_, labelNames_, labels);
    if (amount < 0) {
        throw std::invalid_argument(name_ + ": counters can only increase");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    series_[labels] += amount;
}

double CounterFamily::value(const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(labels);
    return it != series_.end() ? it->second : 0.0;
}

void CounterFamily::write(std::ostream& out) const {
    writeHeader(out, name_, help_, "counter");
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [labels, value] : series_) {
        out << name_ << labelSet(labelNames_, labels) << ' ' << formatValue(value) << '\n';
    }
}

// ═══════════════════════════════════════════
//  HistogramFamily
// ═══════════════════════════════════════════

HistogramFamily::HistogramFamily(std::string name, std::string help,
                                 std::vector<std::string> labelNames,
                                 std::vector<double> buckets)
    : name_(std::move(name))
    , help_(std::move(help))
    , labelNames_(std::move(labelNames))
    , buckets_(std::move(buckets))
{
    if (buckets_.empty()) {
        throw std::invalid_argument(name_ + ": a histogram needs at least one bucket");
    }
    if (std::adjacent_find(buckets_.begin(), buckets_.end(),
                           [](double a, double b) { return a >= b; }) != buckets_.end()) {
        throw std::invalid_argument(name_ + ": bucket bounds must be strictly ascending");
    }
}

void HistogramFamily::observe(const Labels& labels, double value) {
    checkArity(name_, labelNames_, labels);

    // First bound with value <= bound; past the end means +Inf
    auto bound = std::lower_bound(buckets_.begin(), buckets_.end(), value);
    auto index = static_cast<std::size_t>(std::distance(buckets_.begin(), bound));
    if (std::isnan(value)) index = buckets_.size();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = series_[labels];
    if (series.counts.empty()) {
        series.counts.assign(buckets_.size() + 1, 0);
    }
    series.counts[index]++;
    series.sum += value;
    series.count++;
}

std::uint64_t HistogramFamily::count(const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(labels);
    return it != series_.end() ? it->second.count : 0;
}

double HistogramFamily::sum(const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(labels);
    return it != series_.end() ? it->second.sum : 0.0;
}

std::vector<std::uint64_t> HistogramFamily::cumulativeCounts(const Labels& labels) const {
    std::vector<std::uint64_t> result(buckets_.size() + 1, 0);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(labels);
    if (it == series_.end()) return result;

    std::uint64_t running = 0;
    for (std::size_t i = 0; i < result.size(); ++i) {
        running += it->second.counts[i];
        result[i] = running;
    }
    return result;
}

void HistogramFamily::write(std::ostream& out) const {
    writeHeader(out, name_, help_, "histogram");
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [labels, series] : series_) {
        std::uint64_t running = 0;
        for (std::size_t i = 0; i <= buckets_.size(); ++i) {
            running += series.counts[i];
            auto le = i < buckets_.size() ? formatValue(buckets_[i]) : std::string("+Inf");
            out << name_ << "_bucket" << labelSet(labelNames_, labels, "le", le)
                << ' ' << formatValue(static_cast<double>(running)) << '\n';
        }
        out << name_ << "_count" << labelSet(labelNames_, labels)
            << ' ' << formatValue(static_cast<double>(series.count)) << '\n';
        out << name_ << "_sum" << labelSet(labelNames_, labels)
            << ' ' << formatValue(series.sum) << '\n';
    }
}

// ═══════════════════════════════════════════
//  Gauge
// ═══════════════════════════════════════════

Gauge::Gauge(std::string name, std::string help)
    : name_(std::move(name))
    , help_(std::move(help))
{}

void Gauge::set(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = value;
}

double Gauge::value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

void Gauge::write(std::ostream& out) const {
    writeHeader(out, name_, help_, "gauge");
    out << name_ << ' ' << formatValue(value()) << '\n';
}

// ═══════════════════════════════════════════
//  Process collector
// ═══════════════════════════════════════════

#ifdef __linux__
namespace {

struct ProcessSample {
    double cpuSeconds = 0;
    double startTimeSeconds = 0;
    double virtualBytes = 0;
    double residentBytes = 0;
};

double bootTimeSeconds() {
    std::ifstream file("/proc/stat");
    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("btime ", 0) == 0) {
            return std::strtod(line.c_str() + 6, nullptr);
        }
    }
    return 0;
}

std::optional<ProcessSample> sampleProcess() {
    std::ifstream file("/proc/self/stat");
    std::string content;
    if (!std::getline(file, content)) return std::nullopt;

    // The command name sits in parentheses and may contain spaces
    auto close = content.rfind(')');
    if (close == std::string::npos || close + 2 > content.size()) return std::nullopt;

    std::istringstream rest(content.substr(close + 2));
    std::vector<std::string> fields{std::istream_iterator<std::string>(rest),
                                    std::istream_iterator<std::string>()};
    // fields[0] is field 3 (state) of proc(5)
    if (fields.size() < 22) return std::nullopt;

    auto field = [&](std::size_t procIndex) {
        return std::strtod(fields[procIndex - 3].c_str(), nullptr);
    };

    const double ticks = static_cast<double>(sysconf(_SC_CLK_TCK));
    const double pageSize = static_cast<double>(sysconf(_SC_PAGESIZE));

    ProcessSample sample;
    sample.cpuSeconds = (field(14) + field(15)) / ticks;
    sample.startTimeSeconds = bootTimeSeconds() + field(22) / ticks;
    sample.virtualBytes = field(23);
    sample.residentBytes = field(24) * pageSize;
    return sample;
}

double openFileDescriptors() {
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc/self/fd", ec);
    if (ec) return 0;
    return static_cast<double>(std::distance(it, std::filesystem::directory_iterator{}));
}

void writeScalar(std::ostream& out, const char* name, const char* help,
                 const char* type, double value) {
    writeHeader(out, name, help, type);
    out << name << ' ' << formatValue(value) << '\n';
}

} // namespace

void writeProcessMetrics(std::ostream& out) {
    auto sample = sampleProcess();
    if (!sample) return;

    writeScalar(out, "process_virtual_memory_bytes", "Virtual memory size in bytes.",
                "gauge", sample->virtualBytes);
    writeScalar(out, "process_resident_memory_bytes", "Resident memory size in bytes.",
                "gauge", sample->residentBytes);
    writeScalar(out, "process_start_time_seconds",
                "Start time of the process since unix epoch in seconds.",
                "gauge", sample->startTimeSeconds);
    writeScalar(out, "process_cpu_seconds_total", "Total user and system CPU time spent in seconds.",
                "counter", sample->cpuSeconds);
    writeScalar(out, "process_open_fds", "Number of open file descriptors.",
                "gauge", openFileDescriptors());

    rlimit limit{};
    if (getrlimit(RLIMIT_NOFILE, &limit) == 0) {
        writeScalar(out, "process_max_fds", "Maximum number of open file descriptors.",
                    "gauge", static_cast<double>(limit.rlim_cur));
    }
}
#else
void writeProcessMetrics(std::ostream&) {}
#endif

// ═══════════════════════════════════════════
//  Registry
// ═══════════════════════════════════════════

const std::vector<double>& Registry::latencyBuckets() {
    static const std::vector<double> buckets = {
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0
    };
    return buckets;
}

const char* Registry::contentType() {
    return "text/plain; version=0.0.4; charset=utf-8";
}

Registry::Registry(bool processMetrics)
    : processMetrics_(processMetrics)
    , requests_(kRequestsTotal, "Total HTTP requests", {"method", "endpoint", "status"})
    , latency_(kRequestDuration, "HTTP request latency in seconds",
               {"method", "endpoint"}, latencyBuckets())
    , uptime_(kUptime, "Application uptime in seconds")
{}

void Registry::recordRequest(const std::string& method, const std::string& endpoint,
                             int statusCode) {
    requests_.inc({method, endpoint, std::to_string(statusCode)});
}

void Registry::observeLatency(const std::string& method, const std::string& endpoint,
                              double seconds) {
    latency_.observe({method, endpoint}, seconds);
}

void Registry::setUptime(double seconds) {
    uptime_.set(seconds);
}

std::string Registry::exportText() const {
    std::ostringstream out;
    if (processMetrics_) {
        writeProcessMetrics(out);
    }
    requests_.write(out);
    latency_.write(out);
    uptime_.write(out);
    return out.str();
}

double Registry::requestCount(const std::string& method, const std::string& endpoint,
                              int statusCode) const {
    return requests_.value({method, endpoint, std::to_string(statusCode)});
}

std::uint64_t Registry::latencyCount(const std::string& method,
                                     const std::string& endpoint) const {
    return latency_.count({method, endpoint});
}

} // namespace pilot::metrics
