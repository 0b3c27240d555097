#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>

namespace socks5d
{

struct config
{
    std::uint32_t workers = 0;

    struct log_t
    {
        std::string level = "info";
        std::string file = "socks5d.log";
    } log;

    struct socks_t
    {
        std::string host = "127.0.0.1";
        std::uint16_t port = 8080;
    } socks;

    struct auth_t
    {
        bool enabled = true;
        std::string username = "user";
        std::string password = "password";
    } auth;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> parse_config_text(const std::string& text);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

}    // namespace socks5d

#endif
