#include "store_executor.hpp"
#include "event_logger.hpp"

#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>

namespace parley {

StoreExecutor::StoreExecutor(std::size_t threads)
    : pool_(threads == 0 ? 1 : threads)
    , size_(threads == 0 ? 1 : threads)
{
}

StoreExecutor::~StoreExecutor() {
    stop();
    join();
}

void StoreExecutor::submit(net::any_io_executor home, Work work, Completion done) {
    if (stopped_.load()) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::LIFECYCLE,
                         "internal", "Store work submitted after shutdown; dropped");
        return;
    }

    // Holding outstanding work keeps the home context's run() alive until
    // the completion has been delivered.
    auto tracked = net::prefer(home, net::execution::outstanding_work.tracked);

    net::post(pool_, [tracked, work = std::move(work), done = std::move(done)]() mutable {
        std::exception_ptr error;
        try {
            work();
        } catch (...) {
            error = std::current_exception();
        }
        net::post(tracked, [done = std::move(done), error]() {
            done(error);
        });
    });
}

void StoreExecutor::stop() {
    if (!stopped_.exchange(true)) {
        pool_.stop();
    }
}

void StoreExecutor::join() {
    pool_.join();
}

}
