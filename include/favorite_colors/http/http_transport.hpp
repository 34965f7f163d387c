#pragma once

#include <favorite_colors/config/app_config.hpp>
#include <favorite_colors/core/result.hpp>
#include <favorite_colors/mcp/mcp_server.hpp>

#include <functional>
#include <memory>
#include <string>

#include <httplib.h>

namespace favorite_colors {

struct HttpTransportOptions {
    ListenAddress listen;
    bool use_https = false;
    std::string cert_file;
    std::string key_file;
};

// Adds the CORS headers every endpoint carries.
void ApplyCorsHeaders(httplib::Response& res);

// ---------------------------------------------------------------------------
// HttpTransport: serves the dispatcher over HTTP(S) with cpp-httplib.
//
//   POST /mcp                                  JSON-RPC request/response
//   OPTIONS *                                  CORS preflight
//   GET  /                                     HTML info page
//   GET  /.well-known/oauth-protected-resource static resource document
//
// Requests run on httplib's worker pool; the dispatcher is shared between
// workers and only the color store behind it is mutable.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(const McpServer& server, HttpTransportOptions options);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Bind the listening socket. Port 0 picks a free port.
    Result<void, Error> Bind();

    // Serve on the bound socket until Stop() is called. Blocks.
    Result<void, Error> Serve();

    // Bind, serve on a background thread and return once should_stop()
    // reports true (polled) or the listener exits on its own.
    Result<void, Error> Run(const std::function<bool()>& should_stop);

    void Stop();

    // Block until the listener accepts connections (after Serve() starts).
    void WaitUntilReady() const;

    [[nodiscard]] int Port() const noexcept { return bound_port_; }

    // Endpoint handlers, exposed for direct testing.
    void HandleMcp(const httplib::Request& req, httplib::Response& res) const;
    void HandleRoot(const httplib::Request& req, httplib::Response& res) const;
    void HandleOAuthResource(const httplib::Request& req, httplib::Response& res) const;

private:
    void RegisterRoutes();
    void LogBanner() const;
    [[nodiscard]] std::string Scheme() const;

    const McpServer& server_;
    HttpTransportOptions options_;
    std::unique_ptr<httplib::Server> http_;
    int bound_port_ = 0;
};

} // namespace favorite_colors
