#pragma once

#include "rup/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <unordered_map>
#include <vector>

namespace rup {
namespace network {

/**
 * @brief Request context with URL parameters extracted from route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :id

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware function type (can modify response or short-circuit)
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

/**
 * @brief Single route in the router
 */
struct Route {
    HttpMethod method;
    std::string pattern;              // Original pattern like "/files/:id"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    bool matches_path(const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief HTTP Router for organizing request handlers
 *
 * Features:
 * - Method-based routing (GET, POST, PATCH, HEAD, DELETE, OPTIONS)
 * - URL parameter extraction (/files/:id)
 * - Middleware support (logging, auth, etc.)
 * - Route groups sharing the parent's route table
 * - 405 with an Allow header when the path exists under another method
 *
 * Example usage:
 * @code
 * HttpRouter router;
 * auto uploads = router.group("/files");
 * uploads->post("", handle_create);
 * uploads->head("/:id", handle_status);
 * uploads->patch("/:id", handle_chunk);
 * @endcode
 *
 * Matching is done against the request path; query strings are ignored.
 */
class HttpRouter {
public:
    HttpRouter();

    // ────────────────────────────────────────────────────────────
    // Route Registration
    // ────────────────────────────────────────────────────────────

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void patch(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void head(const std::string& pattern, RouteHandler handler);
    void options(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    // ────────────────────────────────────────────────────────────
    // Route Groups
    // ────────────────────────────────────────────────────────────

    /**
     * @brief Create a route group with a common prefix
     *
     * Routes registered on the group land in this router's table.
     */
    std::shared_ptr<HttpRouter> group(const std::string& prefix);

    // ────────────────────────────────────────────────────────────
    // Middleware
    // ────────────────────────────────────────────────────────────

    /**
     * @brief Add middleware to run before route handlers
     *
     * Middleware runs in registration order. Returning false stops handling
     * and sends the response the middleware filled in.
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    // ────────────────────────────────────────────────────────────
    // Request Handling
    // ────────────────────────────────────────────────────────────

    /**
     * @brief Dispatch a request to its route; handler exceptions become 500
     */
    HttpResponse handle_request(const HttpRequest& request);

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_->size(); }

private:
    std::shared_ptr<std::vector<Route>> routes_;
    std::shared_ptr<std::vector<Middleware>> middlewares_;
    RouteHandler not_found_handler_;
    std::string prefix_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    /// Comma separated methods registered for the path, empty if none.
    std::string allowed_methods(const std::string& path) const;
};

/**
 * @brief Convert URL pattern to regex
 *
 * Converts:
 *   "/files/:id"         → "^/files/([^/]+)$"
 *   "/files/:id/parts"   → "^/files/([^/]+)/parts$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace rup
