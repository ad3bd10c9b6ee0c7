#include "metrics.hpp"

#include <sstream>

namespace parley {

namespace {

struct MetricInfo {
    const char* name;
    const char* help;
};

constexpr std::array<MetricInfo, static_cast<std::size_t>(Counter::Count)> kCounters = {{
    {"requests_total", "Client frames received by logged-in or logging-in sessions."},
    {"request_errors_total", "Requests answered with an Error event."},
    {"frames_dropped_total", "Frames ignored because the session was not logged in."},
    {"messages_sent_total", "Messages stored and fanned out."},
    {"connections_rejected_total", "Connections refused by the global or per-IP limit."},
}};

constexpr std::array<MetricInfo, static_cast<std::size_t>(Gauge::Count)> kGauges = {{
    {"sessions_active", "Open WebSocket sessions."},
    {"users_online", "Users with a live presence entry."},
}};

template <typename Info, typename Values>
void write_family(std::ostringstream& out, const Info& info, const Values& values, const char* type) {
    for (std::size_t i = 0; i < info.size(); ++i) {
        out << "# HELP parley_" << info[i].name << " " << info[i].help << "\n"
            << "# TYPE parley_" << info[i].name << " " << type << "\n"
            << "parley_" << info[i].name << " " << values[i] << "\n";
    }
}

}

const char* metric_name(Counter counter) {
    return kCounters[static_cast<std::size_t>(counter)].name;
}

const char* metric_name(Gauge gauge) {
    return kGauges[static_cast<std::size_t>(gauge)].name;
}

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry instance;
    return instance;
}

void MetricsRegistry::increment(Counter counter, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[static_cast<std::size_t>(counter)] += value;
}

double MetricsRegistry::get(Counter counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_[static_cast<std::size_t>(counter)];
}

void MetricsRegistry::set(Gauge gauge, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[static_cast<std::size_t>(gauge)] = value;
}

void MetricsRegistry::add(Gauge gauge, double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[static_cast<std::size_t>(gauge)] += delta;
}

double MetricsRegistry::get(Gauge gauge) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gauges_[static_cast<std::size_t>(gauge)];
}

std::string MetricsRegistry::collect_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    write_family(out, kCounters, counters_, "counter");
    write_family(out, kGauges, gauges_, "gauge");
    return out.str();
}

void MetricsRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.fill(0.0);
    gauges_.fill(0.0);
}

}
