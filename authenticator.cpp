#include <string>
#include <cstdlib>
#include <utility>

#include <openssl/crypto.h>

#include "authenticator.h"

namespace socks5d
{

namespace
{

std::string env_or(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }
    return value;
}

bool equal_text(const std::string& lhs, const std::string& rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    if (lhs.empty())
    {
        return true;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}    // namespace

authenticator::authenticator(credentials expected) : expected_(std::move(expected)) {}

credentials authenticator::resolve_credentials(const credentials& configured)
{
    credentials resolved;
    resolved.username = env_or("PROXY_USERNAME", configured.username);
    resolved.password = env_or("PROXY_PASSWORD", configured.password);
    return resolved;
}

bool authenticator::authenticate(const std::string& username, const std::string& password) const
{
    const bool user_ok = equal_text(username, expected_.username);
    const bool pass_ok = equal_text(password, expected_.password);
    return user_ok && pass_ok;
}

}    // namespace socks5d
