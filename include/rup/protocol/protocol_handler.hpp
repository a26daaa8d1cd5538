#pragma once

#include "rup/core/error.hpp"
#include "rup/network/http_router.hpp"
#include "rup/protocol/authenticator.hpp"
#include "rup/session/session_manager.hpp"

#include <optional>
#include <string>

namespace rup::protocol {

struct HandlerOptions {
    std::string base_path = "/files";   ///< Collection path the routes are mounted on
    std::string public_url;             ///< Scheme and host prefixed to Location, may be empty
};

/**
 * @brief TUS 1.0.0 front end of the session manager
 *
 * Routes (relative to base_path):
 *   OPTIONS ""      capability discovery, no auth
 *   POST    ""      create (with optional initial chunk)
 *   HEAD    "/:id"  offset and length, no body
 *   PATCH   "/:id"  apply one chunk
 *   DELETE  "/:id"  terminate
 *   GET     "/:id"  JSON description of the upload
 *
 * Every request except OPTIONS is checked in this order before the session
 * manager is consulted: Tus-Resumable version, then bearer authentication.
 * Every response carries Tus-Resumable.
 */
class ProtocolHandler {
public:
    ProtocolHandler(session::SessionManager& manager,
                    const Authenticator& authenticator,
                    HandlerOptions options = {});

    void register_routes(network::HttpRouter& router);

    network::HttpResponse handle_options(const network::HttpContext& ctx);
    network::HttpResponse handle_create(const network::HttpContext& ctx);
    network::HttpResponse handle_head(const network::HttpContext& ctx);
    network::HttpResponse handle_patch(const network::HttpContext& ctx);
    network::HttpResponse handle_delete(const network::HttpContext& ctx);
    network::HttpResponse handle_info(const network::HttpContext& ctx);

    std::string location_for(const std::string& session_id) const;

private:
    /// Version and identity checks shared by every upload route.
    std::optional<network::HttpResponse> admit(const network::HttpRequest& request,
                                               std::string& owner,
                                               bool check_version = true) const;

    /// Finalize an upload whose offset reached its length; failures are retried by a later PATCH.
    UploadResult<void> finalize_if_done(const std::string& session_id, const std::string& owner);

    static network::HttpResponse error_response(const UploadError& error, bool with_body = true);
    static network::HttpResponse tus_response(network::HttpStatus status);

    session::SessionManager& manager_;
    const Authenticator& authenticator_;
    HandlerOptions options_;
};

} // namespace rup::protocol
