#include "rup/protocol/authenticator.hpp"

#include <strings.h>

namespace rup::protocol {

TokenAuthenticator::TokenAuthenticator(std::unordered_map<std::string, std::string> tokens)
    : tokens_(std::move(tokens)) {
}

std::optional<std::string> TokenAuthenticator::authenticate(const network::HttpRequest& request) const {
    static const std::string scheme = "Bearer ";

    const std::string header = request.get_header("Authorization");
    if (header.size() <= scheme.size() ||
        strncasecmp(header.c_str(), scheme.c_str(), scheme.size()) != 0) {
        return std::nullopt;
    }

    auto it = tokens_.find(header.substr(scheme.size()));
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TokenAuthenticator::add_token(const std::string& token, const std::string& owner_id) {
    tokens_[token] = owner_id;
}

} // namespace rup::protocol
