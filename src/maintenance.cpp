#include "maintenance.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "presence_registry.hpp"
#include "store_executor.hpp"

#include <boost/asio/post.hpp>
#include <sstream>

namespace parley {

MaintenanceReport collect_maintenance(Store& store, PresenceRegistry& presence) {
    MaintenanceReport report;
    report.stats = store.stats();
    report.swept = presence.cleanup_dead_entries();
    report.online = presence.online_count();
    MetricsRegistry::instance().set(Gauge::UsersOnline, static_cast<double>(report.online));
    return report;
}

MaintenanceTimer::MaintenanceTimer(net::io_context& ioc,
                                   Store& store,
                                   PresenceRegistry& presence,
                                   StoreExecutor& executor,
                                   std::chrono::milliseconds interval)
    : ioc_(ioc)
    , timer_(ioc)
    , store_(store)
    , presence_(presence)
    , executor_(executor)
    , interval_(interval)
{
}

void MaintenanceTimer::run() {
    net::post(ioc_, [self = shared_from_this()]() { self->arm(); });
}

void MaintenanceTimer::stop() {
    net::post(ioc_, [self = shared_from_this()]() {
        self->stopped_ = true;
        self->timer_.cancel();
    });
}

void MaintenanceTimer::arm() {
    if (stopped_) return;
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        self->on_tick(ec);
    });
}

void MaintenanceTimer::on_tick(boost::system::error_code ec) {
    if (ec || stopped_) return;

    auto report = std::make_shared<MaintenanceReport>();
    auto self = shared_from_this();
    executor_.submit(ioc_.get_executor(),
        [self, report]() { *report = collect_maintenance(self->store_, self->presence_); },
        [self, report](std::exception_ptr error) { self->on_collected(error, *report); });
}

void MaintenanceTimer::on_collected(std::exception_ptr error, const MaintenanceReport& report) {
    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE,
                             "store", std::string("Stats collection failed: ") + e.what());
        } catch (...) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE,
                             "store", "Stats collection failed: non-standard exception");
        }
        arm();
        return;
    }

    std::stringstream ss;
    ss << "users=" << report.stats.users << " groups=" << report.stats.groups
       << " messages=" << report.stats.messages << " index_entries=" << report.stats.index_entries
       << " online=" << report.online << " swept=" << report.swept;
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "store", ss.str());
    EventLogger::log(EventLogger::Level::TRACE, EventLogger::EventType::LIFECYCLE, "internal",
                     MetricsRegistry::instance().collect_prometheus());

    if (on_report_) on_report_(report);
    arm();
}

}
