#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "log.h"

namespace socks5d
{

namespace
{

struct level_alias
{
    const char* name;
    spdlog::level::level_enum value;
};

constexpr level_alias kLevels[] = {
    {.name = "trace", .value = spdlog::level::trace},
    {.name = "debug", .value = spdlog::level::debug},
    {.name = "info", .value = spdlog::level::info},
    {.name = "warn", .value = spdlog::level::warn},
    {.name = "warning", .value = spdlog::level::warn},
    {.name = "err", .value = spdlog::level::err},
    {.name = "error", .value = spdlog::level::err},
    {.name = "off", .value = spdlog::level::off},
};

std::uint32_t env_or_default(const char* name, const std::uint32_t fallback)
{
    const char* value = std::getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }
    const long parsed = std::strtol(value, nullptr, 10);
    if (parsed <= 0)
    {
        return fallback;
    }
    return static_cast<std::uint32_t>(parsed);
}

std::uint32_t get_log_file_size()
{
    constexpr std::uint32_t kFileSize = 50 * 1024 * 1024;
    return env_or_default("SOCKS5D_LOG_FILE_SIZE", kFileSize);
}

std::uint32_t get_log_file_count()
{
    constexpr std::uint32_t kFileCount = 5;
    return env_or_default("SOCKS5D_LOG_FILE_COUNT", kFileCount);
}

void init_default_log(const std::string& filename)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!filename.empty())
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, get_log_file_size(), get_log_file_count()));
    }
    auto logger = std::make_shared<spdlog::logger>("", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::set_pattern("%Y%m%d %T.%f %t %L %v %s:%#");
}

// TRACE and DEBUG in the environment only ever make logging more verbose.
void apply_level(spdlog::level::level_enum level)
{
    if (std::getenv("TRACE") != nullptr)
    {
        level = spdlog::level::trace;
    }
    else if (std::getenv("DEBUG") != nullptr && level > spdlog::level::debug)
    {
        level = spdlog::level::debug;
    }
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_level_name(const std::string& level)
{
    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return spdlog::level::info;
}

}    // namespace

void init_log(const std::string& filename)
{
    init_default_log(filename);

    apply_level(spdlog::level::info);
}

void set_level(const std::string& level) { apply_level(parse_level_name(level)); }

bool is_known_level(const std::string& level)
{
    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return true;
        }
    }
    return false;
}

void shutdown_log()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

}    // namespace socks5d
