#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>

namespace parley {

enum class Counter : std::size_t {
    RequestsTotal,
    RequestErrorsTotal,
    FramesDroppedTotal,
    MessagesSentTotal,
    ConnectionsRejectedTotal,
    Count
};

enum class Gauge : std::size_t {
    SessionsActive,
    UsersOnline,
    Count
};

// Exported name, without the "parley_" prefix.
const char* metric_name(Counter counter);
const char* metric_name(Gauge gauge);

// Process-wide counters and gauges. The metric set is fixed, so the
// Prometheus dump always lists every metric, zeros included.
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    void increment(Counter counter, double value = 1.0);
    double get(Counter counter) const;

    void set(Gauge gauge, double value);
    // `delta` may be negative.
    void add(Gauge gauge, double delta);
    double get(Gauge gauge) const;

    // Text exposition format 0.0.4.
    std::string collect_prometheus() const;

    void reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::array<double, static_cast<std::size_t>(Counter::Count)> counters_{};
    std::array<double, static_cast<std::size_t>(Gauge::Count)> gauges_{};
};

}
