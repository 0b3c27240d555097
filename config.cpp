#include <cerrno>
#include <cstdio>
#include <string>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <expected>
#include <optional>

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>

#include "log.h"
#include "config.h"
#include "reflect.h"

namespace socks5d::reflect
{

template <typename Vis>
void reflect(Vis& vis, config::log_t& v)
{
    begin_object(vis);
    field(vis, "level", v.level);
    field(vis, "file", v.file);
    end_object(vis);
}

template <typename Vis>
void reflect(Vis& vis, config::socks_t& v)
{
    begin_object(vis);
    field(vis, "host", v.host);
    field(vis, "port", v.port);
    end_object(vis);
}

template <typename Vis>
void reflect(Vis& vis, config::auth_t& v)
{
    begin_object(vis);
    field(vis, "enabled", v.enabled);
    field(vis, "username", v.username);
    field(vis, "password", v.password);
    end_object(vis);
}

template <typename Vis>
void reflect(Vis& vis, config& v)
{
    begin_object(vis);
    field(vis, "workers", v.workers);
    field(vis, "log", v.log);
    field(vis, "socks", v.socks);
    field(vis, "auth", v.auth);
    end_object(vis);
}

}    // namespace socks5d::reflect

namespace socks5d
{

namespace
{

// RFC 1929 carries both fields behind a one byte length.
constexpr std::size_t kAuthFieldMaxLen = 255;

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

[[nodiscard]] std::expected<void, config_error> validate_log_config(const config::log_t& log)
{
    if (!is_known_level(log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be trace/debug/info/warn/error/off"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_socks_config(const config::socks_t& socks)
{
    if (socks.host.empty())
    {
        return std::unexpected(make_config_error("/socks/host", "must be non-empty ip address"));
    }
    boost::system::error_code ec;
    (void)boost::asio::ip::make_address(socks.host, ec);
    if (ec)
    {
        return std::unexpected(make_config_error("/socks/host", "must be valid ip address"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_auth_config(const config::auth_t& auth)
{
    if (auth.username.size() > kAuthFieldMaxLen)
    {
        return std::unexpected(make_config_error("/auth/username", "must be at most 255 bytes"));
    }
    if (auth.password.size() > kAuthFieldMaxLen)
    {
        return std::unexpected(make_config_error("/auth/password", "must be at most 255 bytes"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (const auto log_result = validate_log_config(cfg.log); !log_result)
    {
        return std::unexpected(log_result.error());
    }
    if (const auto socks_result = validate_socks_config(cfg.socks); !socks_result)
    {
        return std::unexpected(socks_result.error());
    }
    if (const auto auth_result = validate_auth_config(cfg.auth); !auth_result)
    {
        return std::unexpected(auth_result.error());
    }
    return {};
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024] = {0};
    std::string result;
    FILE* f = fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (ferror(f) != 0)
            {
                fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    fclose(f);
    return result;
}

}    // namespace

std::expected<config, config_error> parse_config_text(const std::string& text)
{
    if (const auto nul_pos = text.find('\0'); nul_pos != std::string::npos)
    {
        return std::unexpected(make_config_error("/", "json parse error at offset " + std::to_string(nul_pos) + ": embedded nul byte"));
    }
    rapidjson::Document reader;
    const rapidjson::ParseResult parse_result = reader.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }

    config cfg;
    reflect::json_reader json_reader(reader);
    reflect::reflect(json_reader, cfg);
    if (!json_reader.ok())
    {
        return std::unexpected(make_config_error(json_reader.failed_path(), "invalid type or value"));
    }

    if (const auto validate_result = validate_config(cfg); !validate_result)
    {
        return std::unexpected(validate_result.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return parse_config_text(*file_content);
}

std::optional<config> parse_config(const std::string& filename)
{
    const auto parsed = parse_config_with_error(filename);
    if (!parsed)
    {
        return std::nullopt;
    }
    return *parsed;
}

std::string dump_config(const config& cfg) { return reflect::to_json(cfg); }

std::string dump_default_config() { return dump_config(config{}); }

}    // namespace socks5d
