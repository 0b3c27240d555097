#include <memory>
#include <string>
#include <thread>
#include <cstdio>
#include <csignal>
#include <cstdint>
#include <cstring>

#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "config.h"
#include "statistics.h"
#include "context_pool.h"
#include "socks_server.h"
#include "authenticator.h"

namespace
{

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s              Run with default configuration\n", prog);
    std::fprintf(stdout, "%s -c <config>  Run with configuration file\n", prog);
    std::fprintf(stdout, "%s config       Dump default configuration\n", prog);
}

int parse_config_from_file(const std::string& file, socks5d::config& cfg)
{
    const auto parsed = socks5d::parse_config_with_error(file);
    if (!parsed)
    {
        const auto& error = parsed.error();
        std::fprintf(stderr, "parse config failed path %s reason %s\n", error.path.c_str(), error.reason.c_str());
        return -1;
    }
    cfg = *parsed;
    return 0;
}

std::uint32_t resolve_worker_threads(const socks5d::config& cfg)
{
    if (cfg.workers > 0)
    {
        return cfg.workers;
    }

    const auto threads_count = std::thread::hardware_concurrency();
    if (threads_count > 0)
    {
        return threads_count;
    }
    return 4;
}

bool register_signal(boost::asio::signal_set& signals, const int signal, const char* signal_name)
{
    boost::system::error_code ec;
    signals.add(signal, ec);
    if (!ec)
    {
        return true;
    }
    LOG_ERROR("fatal failed to register {} error {}", signal_name, ec.message());
    return false;
}

void log_statistics()
{
    const auto& stats = socks5d::statistics::instance();
    LOG_INFO("uptime {}s connections {} auth failures {} connect failures {} rejected commands {} bytes client_to_remote {} remote_to_client {}",
             stats.uptime_seconds(),
             stats.total_connections(),
             stats.auth_failures(),
             stats.connect_failures(),
             stats.rejected_commands(),
             stats.bytes_client_to_remote(),
             stats.bytes_remote_to_client());
}

int run(const char* prog, const socks5d::config& cfg)
{
    socks5d::init_log(cfg.log.file);
    socks5d::set_level(cfg.log.level);
    socks5d::statistics::instance().start_time();

    boost::system::error_code pool_ec;
    socks5d::io_context_pool pool(resolve_worker_threads(cfg), pool_ec);
    if (pool_ec)
    {
        LOG_ERROR("io context pool init failed {}", pool_ec.message());
        socks5d::shutdown_log();
        return 1;
    }

    std::shared_ptr<const socks5d::authenticator> auth;
    if (cfg.auth.enabled)
    {
        const socks5d::credentials configured{.username = cfg.auth.username, .password = cfg.auth.password};
        auth = std::make_shared<const socks5d::authenticator>(socks5d::authenticator::resolve_credentials(configured));
        LOG_INFO("expecting user {}", auth->username());
    }
    else
    {
        LOG_WARN("authentication disabled, only no auth clients are accepted");
    }

    auto server = std::make_shared<socks5d::socks_server>(pool, cfg.socks, auth);
    server->start();
    if (!server->running())
    {
        LOG_ERROR("socks server start failed");
        pool.shutdown();
        pool.run();
        socks5d::shutdown_log();
        return 1;
    }

    boost::asio::signal_set signals(pool.get_io_context());
    if (!register_signal(signals, SIGINT, "sigint") || !register_signal(signals, SIGTERM, "sigterm"))
    {
        server->stop();
        pool.shutdown();
        pool.run();
        socks5d::shutdown_log();
        return 1;
    }

    signals.async_wait(
        [&pool, server](const boost::system::error_code& error, const int signal)
        {
            if (error)
            {
                return;
            }
            LOG_INFO("received signal {} shutting down", signal);
            server->stop();
            pool.shutdown();
        });

    pool.run();
    log_statistics();
    LOG_INFO("{} shutdown", prog);
    socks5d::shutdown_log();
    return 0;
}

}    // namespace

int main(int argc, char** argv)
{
    socks5d::config cfg;
    if (argc < 2)
    {
        return run(argv[0], cfg);
    }

    const char* mode = argv[1];
    if (std::strcmp(mode, "config") == 0)
    {
        const std::string default_config = socks5d::dump_default_config();
        std::fputs(default_config.c_str(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }

    if (std::strcmp(mode, "-c") != 0 || argc <= 2)
    {
        print_usage(argv[0]);
        return -1;
    }

    if (parse_config_from_file(argv[2], cfg) != 0)
    {
        print_usage(argv[0]);
        return -1;
    }
    return run(argv[0], cfg);
}
