#ifndef AUTHENTICATOR_H
#define AUTHENTICATOR_H

#include <string>

namespace socks5d
{

struct credentials
{
    std::string username = "user";
    std::string password = "password";
};

// Username/password check for RFC 1929 sub-negotiation. Immutable after
// construction and shared by every session.
class authenticator
{
   public:
    explicit authenticator(credentials expected);

    // Environment variables PROXY_USERNAME and PROXY_PASSWORD take precedence
    // over the configured values.
    [[nodiscard]] static credentials resolve_credentials(const credentials& configured);

    [[nodiscard]] bool authenticate(const std::string& username, const std::string& password) const;

    [[nodiscard]] const std::string& username() const { return expected_.username; }

   private:
    credentials expected_;
};

}    // namespace socks5d

#endif
