#ifndef CONTEXT_POOL_H
#define CONTEXT_POOL_H

#include <atomic>
#include <memory>
#include <vector>
#include <cstddef>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/system/error_code.hpp>

namespace socks5d
{

// One io_context per thread. Sessions placed on a context never migrate, so
// everything a session does runs on a single thread.
class io_context_pool
{
   public:
    io_context_pool(std::size_t pool_size, boost::system::error_code& ec);

    io_context_pool(const io_context_pool&) = delete;
    io_context_pool& operator=(const io_context_pool&) = delete;

    // Blocks until every context ran out of work or was stopped.
    void run();

    // Lets the contexts finish once their outstanding work is done.
    void shutdown();

    void stop();

    [[nodiscard]] boost::asio::io_context& get_io_context();

    [[nodiscard]] std::size_t size() const { return io_contexts_.size(); }

   private:
    using work_guard_t = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::atomic<std::size_t> next_io_context_{0};
    std::vector<std::shared_ptr<boost::asio::io_context>> io_contexts_;
    std::vector<std::shared_ptr<work_guard_t>> work_guards_;
};

}    // namespace socks5d

#endif
