#pragma once

#include "taildrive/network/http_types.hpp"
#include "taildrive/network/url.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace taildrive {
namespace network {

/**
 * @brief Request context with path parameters and decoded query values
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // Path parameters like :id
    QueryParams query;                                    // Decoded ?key=value pairs

    explicit HttpContext(const HttpRequest& req)
        : request(req), query(parse_query(req.query_string())) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }

    bool has_query(const std::string& name) const {
        return query.find(name) != query.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware function type (return false to short-circuit with `res`)
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // Original pattern like "/sync/projects/:id"
    std::vector<std::string> param_names;  // Filled before `regex` is built
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(const std::string& path) const;

    // Captured values are percent-decoded
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief HTTP router for the status/sync service
 *
 * Routes are matched against the request path only; the query string is
 * decoded separately into HttpContext::query.
 *
 * Pattern syntax:
 * - `:name` captures one path segment
 * - `*name` captures the rest of the path, slashes included
 *
 * @code
 * HttpRouter router;
 * router.get("/download/:name", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("file: " + ctx.get_param("name"));
 *     return res;
 * });
 * router.post("/sync/projects/:id/pause", handle_pause);
 * @endcode
 *
 * A wildcard segment such as `*path` after `/upload` matches the whole
 * remaining path.
 *
 * A path that matches a route registered for a different method yields
 * 405 Method Not Allowed; a path that matches nothing goes to the not-found
 * handler.
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers, in insertion order
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request; handler exceptions become 500 responses
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
};

/**
 * @brief Convert a route pattern to a regex
 *
 * Converts:
 *   "/sync/projects/:id"   → "^/sync/projects/([^/]+)$"
 *   a trailing `*path`     → "(.*)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace taildrive
