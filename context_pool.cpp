#include <memory>
#include <thread>
#include <vector>
#include <cstddef>

#include <boost/asio/post.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "context_pool.h"

namespace socks5d
{

io_context_pool::io_context_pool(const std::size_t pool_size, boost::system::error_code& ec)
{
    if (pool_size == 0)
    {
        ec = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
        LOG_ERROR("io context pool size cannot be 0");
        return;
    }

    for (std::size_t i = 0; i < pool_size; ++i)
    {
        auto ctx = std::make_shared<boost::asio::io_context>(1);
        io_contexts_.push_back(ctx);
        work_guards_.push_back(std::make_shared<work_guard_t>(ctx->get_executor()));
    }
}

void io_context_pool::run()
{
    std::vector<std::thread> threads;
    threads.reserve(io_contexts_.size());

    for (auto& io_context : io_contexts_)
    {
        threads.emplace_back([&io_context]() { io_context->run(); });
    }

    LOG_INFO("io context pool running with {} threads", threads.size());

    for (auto& t : threads)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}

void io_context_pool::shutdown()
{
    LOG_INFO("io context pool releasing work guards");
    for (std::size_t i = 0; i < work_guards_.size(); ++i)
    {
        boost::asio::post(*io_contexts_[i], [guard = work_guards_[i]]() { guard->reset(); });
    }
}

void io_context_pool::stop()
{
    LOG_INFO("io context pool stopping all contexts");
    for (auto& ctx : io_contexts_)
    {
        ctx->stop();
    }
}

boost::asio::io_context& io_context_pool::get_io_context()
{
    const std::size_t index = next_io_context_.fetch_add(1, std::memory_order_relaxed) % io_contexts_.size();
    return *io_contexts_[index];
}

}    // namespace socks5d
