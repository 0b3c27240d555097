#ifndef STATISTICS_H
#define STATISTICS_H

#include <atomic>
#include <chrono>
#include <cstdint>

namespace socks5d
{

class statistics
{
   public:
    static statistics& instance()
    {
        static statistics s;
        return s;
    }

    void start_time() { start_time_ = std::chrono::steady_clock::now(); }

    std::uint64_t uptime_seconds() const
    {
        const auto now = std::chrono::steady_clock::now();
        const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
        if (uptime <= 0)
        {
            return 0;
        }
        return static_cast<std::uint64_t>(uptime);
    }

    void inc_active_connections() { active_connections_++; }
    void dec_active_connections() { active_connections_--; }
    std::uint64_t active_connections() const { return active_connections_.load(); }

    void inc_total_connections() { total_connections_++; }
    std::uint64_t total_connections() const { return total_connections_.load(); }

    void inc_auth_failures() { auth_failures_++; }
    std::uint64_t auth_failures() const { return auth_failures_.load(); }

    void inc_connect_failures() { connect_failures_++; }
    std::uint64_t connect_failures() const { return connect_failures_.load(); }

    void inc_rejected_commands() { rejected_commands_++; }
    std::uint64_t rejected_commands() const { return rejected_commands_.load(); }

    void add_bytes_client_to_remote(std::uint64_t n) { bytes_client_to_remote_ += n; }
    std::uint64_t bytes_client_to_remote() const { return bytes_client_to_remote_.load(); }

    void add_bytes_remote_to_client(std::uint64_t n) { bytes_remote_to_client_ += n; }
    std::uint64_t bytes_remote_to_client() const { return bytes_remote_to_client_.load(); }

   private:
    statistics() = default;

    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    std::atomic<std::uint64_t> active_connections_{0};
    std::atomic<std::uint64_t> total_connections_{0};
    std::atomic<std::uint64_t> auth_failures_{0};
    std::atomic<std::uint64_t> connect_failures_{0};
    std::atomic<std::uint64_t> rejected_commands_{0};
    std::atomic<std::uint64_t> bytes_client_to_remote_{0};
    std::atomic<std::uint64_t> bytes_remote_to_client_{0};
};

}    // namespace socks5d

#endif
