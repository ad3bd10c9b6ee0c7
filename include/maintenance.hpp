#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <exception>
#include <cstddef>
#include <functional>
#include <memory>

#include "store.hpp"

namespace net = boost::asio;

namespace parley {

class PresenceRegistry;
class StoreExecutor;

struct MaintenanceReport {
    StoreStats stats;
    std::size_t online = 0;
    std::size_t swept = 0;
};

// Reads store statistics and sweeps expired presence entries. Blocks on the
// store; call it from a StoreExecutor worker.
MaintenanceReport collect_maintenance(Store& store, PresenceRegistry& presence);

// Periodic stats log. Each tick submits collect_maintenance to the store
// executor and re-arms once the report is back on the io_context, so ticks
// never overlap and no store call runs on an I/O thread.
class MaintenanceTimer : public std::enable_shared_from_this<MaintenanceTimer> {
public:
    using ReportHandler = std::function<void(const MaintenanceReport&)>;

    MaintenanceTimer(net::io_context& ioc,
                     Store& store,
                     PresenceRegistry& presence,
                     StoreExecutor& executor,
                     std::chrono::milliseconds interval);

    // Called on the io_context after each report has been logged.
    void set_report_handler(ReportHandler handler) { on_report_ = std::move(handler); }

    void run();
    void stop();

private:
    void arm();
    void on_tick(boost::system::error_code ec);
    void on_collected(std::exception_ptr error, const MaintenanceReport& report);

    net::io_context& ioc_;
    net::steady_timer timer_;
    Store& store_;
    PresenceRegistry& presence_;
    StoreExecutor& executor_;
    std::chrono::milliseconds interval_;
    ReportHandler on_report_;
    bool stopped_ = false;
};

}
