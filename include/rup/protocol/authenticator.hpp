#pragma once

#include "rup/network/http_types.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace rup::protocol {

/**
 * @brief Identity provider consulted once per request
 *
 * @return Owner id of the authenticated principal, or nothing
 */
class Authenticator {
public:
    virtual ~Authenticator() = default;

    virtual std::optional<std::string> authenticate(const network::HttpRequest& request) const = 0;
};

/**
 * @brief Static table of bearer tokens ("Authorization: Bearer <token>")
 */
class TokenAuthenticator : public Authenticator {
public:
    explicit TokenAuthenticator(std::unordered_map<std::string, std::string> tokens);

    std::optional<std::string> authenticate(const network::HttpRequest& request) const override;

    void add_token(const std::string& token, const std::string& owner_id);

private:
    std::unordered_map<std::string, std::string> tokens_;
};

} // namespace rup::protocol
