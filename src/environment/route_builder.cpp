#include "environment/route_builder.hpp"

#include "environment/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace servefleet::env
{

namespace
{
const std::map<std::string, std::string> kStaticHeaders = {{"Cache-Control", "max-age=3600"}};

std::string read_source(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw ConfigurationError(fmt::format("routes: cannot open '{}'", path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
        throw ConfigurationError(fmt::format("routes: error reading '{}'", path.string()));
    }
    return ss.str();
}
} // namespace

const char *route_kind_name(RouteKind kind) noexcept
{
    switch (kind)
    {
    case RouteKind::Static:
        return "static";
    case RouteKind::Inline:
        return "inline";
    case RouteKind::Mount:
        return "mount";
    }
    return "static";
}

nlohmann::json RouteDescriptor::to_json() const
{
    nlohmann::json j{{"method", method},
                     {"path", url_path},
                     {"kind", route_kind_name(kind)},
                     {"headers", headers}};
    if (!source_path.empty())
        j["source"] = source_path.string();
    if (!content_type.empty())
        j["content_type"] = content_type;
    if (format_args)
        j["format_args"] = *format_args;
    if (kind == RouteKind::Inline)
        j["body"] = inline_body;
    return j;
}

nlohmann::json to_json(const RouteTable &routes)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &r : routes)
        arr.push_back(r.to_json());
    return arr;
}

// ============================================================================
// RoutesBuilder
// ============================================================================

RoutesBuilder::RoutesBuilder()
{
    ensure_default_mount();
}

void RoutesBuilder::ensure_default_mount()
{
    if (!has_mount_point("/"))
    {
        RouteDescriptor root;
        root.kind = RouteKind::Mount;
        root.url_path = "/";
        m_mounts.push_back(std::move(root));
    }
}

void RoutesBuilder::add_static(const fs::path &path, std::optional<nlohmann::json> format_args,
                               std::string content_type, std::string route,
                               std::map<std::string, std::string> headers)
{
    RouteDescriptor r;
    r.method = "GET";
    r.url_path = std::move(route);
    r.kind = RouteKind::Static;
    r.source_path = path;
    r.content_type = std::move(content_type);
    r.headers = std::move(headers);
    r.format_args = std::move(format_args);
    m_static.push_back(std::move(r));
}

void RoutesBuilder::add_handler(std::string method, std::string route, std::string body,
                                std::string content_type)
{
    RouteDescriptor r;
    r.method = std::move(method);
    r.url_path = std::move(route);
    r.kind = RouteKind::Inline;
    r.content_type = std::move(content_type);
    r.inline_body = std::move(body);
    m_handlers.push_back(std::move(r));
}

void RoutesBuilder::add_mount_point(std::string url_base, const fs::path &path)
{
    remove_mount_point(url_base);
    RouteDescriptor r;
    r.kind = RouteKind::Mount;
    r.url_path = std::move(url_base);
    r.source_path = path;
    m_mounts.push_back(std::move(r));
}

bool RoutesBuilder::remove_mount_point(const std::string &url_base)
{
    auto it = std::find_if(m_mounts.begin(), m_mounts.end(),
                           [&](const RouteDescriptor &r) { return r.url_path == url_base; });
    if (it == m_mounts.end())
        return false;
    m_mounts.erase(it);
    return true;
}

bool RoutesBuilder::has_mount_point(const std::string &url_base) const
{
    return std::any_of(m_mounts.begin(), m_mounts.end(),
                       [&](const RouteDescriptor &r) { return r.url_path == url_base; });
}

RouteTable RoutesBuilder::get_routes() const
{
    RouteTable routes;
    routes.reserve(m_static.size() + m_handlers.size() + m_mounts.size());
    routes.insert(routes.end(), m_static.begin(), m_static.end());
    routes.insert(routes.end(), m_handlers.begin(), m_handlers.end());
    routes.insert(routes.end(), m_mounts.rbegin(), m_mounts.rend());
    return routes;
}

// ============================================================================
// build_routes
// ============================================================================

RouteTable build_routes(const TestPaths &test_paths, const RouteOptions &options)
{
    RoutesBuilder builder;

    const fs::path &runner = options.runner_dir;
    const fs::path pdf_js = options.third_party_dir / "pdf_js";

    builder.add_static((runner / "testharness_runner.html").lexically_normal(),
                       nlohmann::json::object(), "text/html", "/testharness_runner.html",
                       kStaticHeaders);
    builder.add_static((runner / "print_reftest_runner.html").lexically_normal(),
                       nlohmann::json::object(), "text/html", "/print_reftest_runner.html",
                       kStaticHeaders);
    builder.add_static((pdf_js / "pdf.js").lexically_normal(), std::nullopt, "text/javascript",
                       "/_pdf_js/pdf.js", kStaticHeaders);
    builder.add_static((pdf_js / "pdf.worker.js").lexically_normal(), std::nullopt,
                       "text/javascript", "/_pdf_js/pdf.worker.js", kStaticHeaders);

    nlohmann::json report_args{{"output", options.pause_after_test},
                               {"timeout_multiplier", options.timeout_multiplier},
                               {"explicit_timeout", options.has_debug_info ? "true" : "false"},
                               {"debug", options.debug_test ? "true" : "false"}};
    builder.add_static((runner / options.testharnessreport).lexically_normal(),
                       std::move(report_args), "text/javascript;charset=utf8",
                       "/resources/testharnessreport.js", kStaticHeaders);

    std::string testdriver = read_source(options.repo_root / "resources" / "testdriver.js");
    testdriver += read_source(runner / "testdriver-extra.js");
    builder.add_handler("GET", "/resources/testdriver.js", std::move(testdriver),
                        "text/javascript");

    for (const auto &[url_base, entry] : test_paths)
    {
        if (url_base == "/")
            continue;
        builder.add_mount_point(url_base, entry.tests_path);
    }

    if (test_paths.find("/") == test_paths.end())
    {
        builder.remove_mount_point("/");
    }

    if (options.generated_bindings_path)
    {
        builder.add_mount_point("/gen/", *options.generated_bindings_path);
    }

    return builder.get_routes();
}

} // namespace servefleet::env
