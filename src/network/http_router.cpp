#include "rup/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace rup {
namespace network {

// ────────────────────────────────────────────────────────────
// Helper: Convert URL pattern to regex
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;

            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }

            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "/?$";  // Tolerate a trailing slash
    return regex_pattern;
}

// ────────────────────────────────────────────────────────────
// Route Implementation
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {

    std::string regex_str = pattern_to_regex(pattern, param_names);

    try {
        regex = std::regex(regex_str);
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid route pattern '{}': {}", pattern, e.what());
        regex = std::regex("^" + pattern + "$");
    }
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    if (method != req_method) {
        return false;
    }
    return matches_path(path);
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        // match[0] is the full string, match[1+] are capture groups
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }

    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter Implementation
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : routes_(std::make_shared<std::vector<Route>>()),
      middlewares_(std::make_shared<std::vector<Middleware>>()),
      not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::patch(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PATCH, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::head(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::HEAD, pattern, std::move(handler));
}

void HttpRouter::options(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::OPTIONS, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    std::string full_pattern = prefix_ + pattern;

    routes_->emplace_back(method, full_pattern, std::move(handler));

    spdlog::debug("Registered route: {} {}",
                  HttpMethodUtils::to_string(method),
                  full_pattern);
}

std::shared_ptr<HttpRouter> HttpRouter::group(const std::string& prefix) {
    auto grouped_router = std::make_shared<HttpRouter>();
    grouped_router->prefix_ = prefix_ + prefix;
    grouped_router->routes_ = routes_;
    grouped_router->middlewares_ = middlewares_;
    return grouped_router;
}

void HttpRouter::use(Middleware middleware) {
    middlewares_->push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : *middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string path = request.path();
    const Route* route = find_route(request.method, path);

    if (route) {
        ctx.params = route->extract_params(path);

        try {
            response = route->handler(ctx);
        } catch (const std::exception& e) {
            spdlog::error("Route handler threw exception: {}", e.what());

            response = HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
            response.set_body("Internal Server Error");
            response.set_header("Content-Type", "text/plain");
        }
    } else if (auto allowed = allowed_methods(path); !allowed.empty()) {
        response = HttpResponse(HttpStatus::METHOD_NOT_ALLOWED);
        response.set_header("Allow", allowed);
        response.set_body("Method Not Allowed");
        response.set_header("Content-Type", "text/plain");
    } else {
        response = not_found_handler_(ctx);
    }

    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;

    for (const auto& route : *routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.pattern;
        route_list.push_back(oss.str());
    }

    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    nlohmann::json body = {
        {"error", "not_found"},
        {"path", ctx.request.path()}
    };
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : *routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

std::string HttpRouter::allowed_methods(const std::string& path) const {
    std::string allowed;
    for (const auto& route : *routes_) {
        if (!route.matches_path(path)) {
            continue;
        }
        const std::string name = HttpMethodUtils::to_string(route.method);
        if (allowed.find(name) != std::string::npos) {
            continue;
        }
        if (!allowed.empty()) {
            allowed += ", ";
        }
        allowed += name;
    }
    return allowed;
}

} // namespace network
} // namespace rup
