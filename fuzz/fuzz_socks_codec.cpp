#include <string>
#include <cstddef>
#include <cstdint>

#include "protocol.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    const auto text = socks5d::socks_codec::decode_text_lossy(data, size);

    // decoded output is valid UTF-8, decoding it again changes nothing
    const auto again = socks5d::socks_codec::decode_text_lossy(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    if (again != text)
    {
        __builtin_trap();
    }

    socks5d::socks_address address;
    address.value = text;
    (void)socks5d::socks_codec::encode_request(data != nullptr && size > 0 ? data[0] : 0, address, static_cast<uint16_t>(size));
    return 0;
}
