#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>

namespace net = boost::asio;

namespace parley {

// Fixed-size worker pool for blocking Store transactions. Completions are
// posted back to the submitting connection's executor, which is kept busy
// (outstanding work) until the completion has run.
class StoreExecutor {
public:
    using Work = std::function<void()>;
    // Receives the exception thrown by the work, or nullptr on success.
    using Completion = std::function<void(std::exception_ptr)>;

    explicit StoreExecutor(std::size_t threads);
    ~StoreExecutor();

    StoreExecutor(const StoreExecutor&) = delete;
    StoreExecutor& operator=(const StoreExecutor&) = delete;

    void submit(net::any_io_executor home, Work work, Completion done);

    // Stops accepting work; queued work is abandoned. Returns immediately.
    void stop();
    // Waits for running work to finish.
    void join();

    bool stopped() const { return stopped_.load(); }
    std::size_t size() const { return size_; }

private:
    net::thread_pool pool_;
    std::size_t size_;
    std::atomic<bool> stopped_{false};
};

}
