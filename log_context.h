#ifndef LOG_CONTEXT_H
#define LOG_CONTEXT_H

#include <ios>
#include <string>
#include <cstdint>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <random>

namespace socks5d
{

namespace log_event
{
constexpr const char* kAccept = "accept";
constexpr const char* kHandshake = "handshake";
constexpr const char* kAuth = "auth";
constexpr const char* kRequest = "request";
constexpr const char* kConnect = "connect";
constexpr const char* kRelay = "relay";
constexpr const char* kConnClose = "conn_close";
}    // namespace log_event

inline std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
    return oss.str();
}

struct connection_context
{
    std::string trace_id;
    std::uint32_t conn_id = 0;
    std::string client_addr;
    std::uint16_t client_port = 0;
    std::string target_host;
    std::uint16_t target_port = 0;

    std::uint64_t tx_bytes = 0;
    std::uint64_t rx_bytes = 0;
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    [[nodiscard]] std::string prefix() const
    {
        std::ostringstream oss;
        if (!trace_id.empty())
        {
            oss << "t" << trace_id << " ";
        }
        oss << "c" << conn_id;
        return oss.str();
    }

    [[nodiscard]] std::string client_info() const
    {
        std::ostringstream oss;
        oss << client_addr << ":" << client_port;
        return oss.str();
    }

    [[nodiscard]] std::string target_info() const
    {
        std::ostringstream oss;
        oss << target_host << ":" << target_port;
        return oss.str();
    }

    [[nodiscard]] double duration_seconds() const
    {
        const auto now = std::chrono::steady_clock::now();
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time);
        return static_cast<double>(duration.count()) / 1000.0;
    }

    // tx is client to remote, rx is remote to client.
    [[nodiscard]] std::string stats_summary() const
    {
        std::ostringstream oss;
        oss << "tx " << tx_bytes << " rx " << rx_bytes << " duration " << std::fixed << std::setprecision(2) << duration_seconds() << "s";
        return oss.str();
    }

    void set_target(const std::string& host, const std::uint16_t port)
    {
        target_host = host;
        target_port = port;
    }

    void new_trace_id() { trace_id = generate_trace_id(); }
};

}    // namespace socks5d

#endif
