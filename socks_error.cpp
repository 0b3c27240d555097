#include <string>

#include <boost/system/error_code.hpp>

#include "socks_error.h"

namespace socks5d
{

namespace
{

class socks_error_category final : public boost::system::error_category
{
   public:
    [[nodiscard]] const char* name() const noexcept override { return "socks5d"; }

    [[nodiscard]] std::string message(const int ev) const override
    {
        switch (static_cast<errc>(ev))
        {
            case errc::kProtocolVersion:
                return "unexpected protocol version";
            case errc::kMalformedRequest:
                return "malformed request";
            case errc::kUnsupportedAddressType:
                return "unsupported address type";
            case errc::kNoAcceptableMethod:
                return "no acceptable authentication method";
            case errc::kAuthenticationFailed:
                return "authentication failed";
            case errc::kUnsupportedCommand:
                return "unsupported command";
            case errc::kPanicRecovered:
                return "relay direction terminated by exception";
        }
        return "unknown socks5d error";
    }
};

}    // namespace

const boost::system::error_category& socks_category() noexcept
{
    static const socks_error_category category;
    return category;
}

boost::system::error_code make_error_code(const errc e) noexcept { return {static_cast<int>(e), socks_category()}; }

}    // namespace socks5d
