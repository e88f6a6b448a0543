#pragma once
/**
 * @file route_builder.hpp
 * @brief Route and mount descriptors handed to the fleet.
 *
 * The fleet serves three kinds of routes: static files (optionally rendered with format
 * arguments), inline bodies, and mount points that map a URL prefix onto a directory.
 */
#include "servefleet_utils_export.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "environment/effective_config.hpp"

namespace servefleet::env
{

enum class RouteKind
{
    Static,
    Inline,
    Mount,
};

SERVEFLEET_UTILS_EXPORT const char *route_kind_name(RouteKind kind) noexcept;

struct SERVEFLEET_UTILS_EXPORT RouteDescriptor
{
    std::string method{"*"};
    /// Route path; the URL base for mounts.
    std::string url_path;
    RouteKind kind{RouteKind::Static};
    /// File (Static) or directory (Mount). Empty for the default mount: serve the doc root.
    std::filesystem::path source_path;
    std::string content_type;
    std::map<std::string, std::string> headers;
    /// Present when the file is a template to be rendered with these arguments.
    std::optional<nlohmann::json> format_args;
    std::string inline_body;

    [[nodiscard]] nlohmann::json to_json() const;
};

using RouteTable = std::vector<RouteDescriptor>;

SERVEFLEET_UTILS_EXPORT nlohmann::json to_json(const RouteTable &routes);

/**
 * @class RoutesBuilder
 * @brief Accumulates routes. Starts with the default "/" mount.
 *
 * `get_routes()` lists static routes, then handlers, then mounts with the most recently
 * added first, so the default "/" mount is consulted last.
 */
class SERVEFLEET_UTILS_EXPORT RoutesBuilder
{
  public:
    RoutesBuilder();

    void add_static(const std::filesystem::path &path, std::optional<nlohmann::json> format_args,
                    std::string content_type, std::string route,
                    std::map<std::string, std::string> headers = {});
    void add_handler(std::string method, std::string route, std::string body,
                     std::string content_type);
    /** @brief Adds or replaces the mount for `url_base`. */
    void add_mount_point(std::string url_base, const std::filesystem::path &path);
    /** @return true if a mount was removed. */
    bool remove_mount_point(const std::string &url_base);
    [[nodiscard]] bool has_mount_point(const std::string &url_base) const;

    [[nodiscard]] RouteTable get_routes() const;

  private:
    void ensure_default_mount();

    std::vector<RouteDescriptor> m_static;
    std::vector<RouteDescriptor> m_handlers;
    std::vector<RouteDescriptor> m_mounts;
};

struct RouteOptions
{
    /// Directory holding the harness runner pages and testdriver-extra.js.
    std::filesystem::path runner_dir;
    /// Checkout root; resources/testdriver.js is read from here.
    std::filesystem::path repo_root;
    /// Third-party assets; pdf.js lives under `<dir>/pdf_js/`.
    std::filesystem::path third_party_dir;
    /// Report script, relative to `runner_dir` unless absolute.
    std::string testharnessreport{"testharnessreport.js"};
    bool pause_after_test{false};
    double timeout_multiplier{1.0};
    bool has_debug_info{false};
    bool debug_test{false};
    /// Generated bindings directory, mounted at "/gen/".
    std::optional<std::filesystem::path> generated_bindings_path;
};

/**
 * @brief Builds the route table for a scope.
 * @throws ConfigurationError if a testdriver source cannot be read.
 */
SERVEFLEET_UTILS_EXPORT RouteTable build_routes(const TestPaths &test_paths,
                                                const RouteOptions &options);

} // namespace servefleet::env
