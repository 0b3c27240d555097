#include <string>
#include <cstddef>
#include <cstdint>

#include "config.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto parsed = socks5d::parse_config_text(input);
    if (parsed)
    {
        const auto dumped = socks5d::dump_config(*parsed);
        (void)socks5d::parse_config_text(dumped);
    }
    return 0;
}
