#include <favorite_colors/http/http_transport.hpp>

#include <favorite_colors/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <optional>
#include <thread>

namespace favorite_colors {

namespace {

constexpr const char* kComponent = "http";

Error MakeTransportError(const std::string& message,
                         ErrorCategory category = ErrorCategory::Transport) {
    return Error{"HttpTransport", message, category};
}

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

void MethodNotAllowed(const httplib::Request&, httplib::Response& res) {
    ApplyCorsHeaders(res);
    res.status = 405;
    res.set_content("Method not allowed\n", "text/plain");
}

void ParseErrorResponse(httplib::Response& res, const std::string& detail) {
    auto body = MakeErrorResponse(std::nullopt,
                                  RpcError{kParseError, "Parse error", detail});
    res.status = 200;
    res.set_content(body.dump(), "application/json");
}

} // anonymous namespace

void ApplyCorsHeaders(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers",
                   "Content-Type, Authorization, Accept, X-Requested-With");
    res.set_header("Access-Control-Max-Age", "86400");
}

HttpTransport::HttpTransport(const McpServer& server, HttpTransportOptions options)
    : server_(server), options_(std::move(options)) {
    if (options_.use_https) {
        http_ = std::make_unique<httplib::SSLServer>(options_.cert_file.c_str(),
                                                     options_.key_file.c_str());
    } else {
        http_ = std::make_unique<httplib::Server>();
    }
    RegisterRoutes();
}

HttpTransport::~HttpTransport() {
    Stop();
}

void HttpTransport::RegisterRoutes() {
    http_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        ApplyCorsHeaders(res);
        res.status = 200;
    });

    http_->Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
        HandleMcp(req, res);
    });
    http_->Get("/mcp", MethodNotAllowed);
    http_->Put("/mcp", MethodNotAllowed);
    http_->Patch("/mcp", MethodNotAllowed);
    http_->Delete("/mcp", MethodNotAllowed);

    http_->Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        HandleRoot(req, res);
    });
    http_->Get("/.well-known/oauth-protected-resource",
               [this](const httplib::Request& req, httplib::Response& res) {
                   HandleOAuthResource(req, res);
               });
}

std::string HttpTransport::Scheme() const {
    return options_.use_https ? "https" : "http";
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> HttpTransport::Bind() {
    using R = Result<void, Error>;

    if (!http_->is_valid()) {
        return R::Err(MakeTransportError(
            "Failed to load TLS certificate '" + options_.cert_file +
                "' or key '" + options_.key_file + "'",
            ErrorCategory::Tls));
    }

    const auto& host = options_.listen.host;
    if (options_.listen.port == 0) {
        bound_port_ = http_->bind_to_any_port(host);
        if (bound_port_ < 0) {
            bound_port_ = 0;
            return R::Err(MakeTransportError("Failed to bind to " + host));
        }
    } else {
        if (!http_->bind_to_port(host, options_.listen.port)) {
            return R::Err(MakeTransportError(
                "Failed to bind to " + host + ":" +
                std::to_string(options_.listen.port)));
        }
        bound_port_ = options_.listen.port;
    }
    return R::Ok();
}

Result<void, Error> HttpTransport::Serve() {
    if (!http_->listen_after_bind()) {
        return Result<void, Error>::Err(MakeTransportError("Server failed to start"));
    }
    return Result<void, Error>::Ok();
}

void HttpTransport::Stop() {
    if (http_) {
        http_->stop();
    }
}

void HttpTransport::WaitUntilReady() const {
    http_->wait_until_ready();
}

Result<void, Error> HttpTransport::Run(const std::function<bool()>& should_stop) {
    auto bound = Bind();
    if (bound.IsErr()) {
        return bound;
    }
    LogBanner();

    std::atomic<bool> finished{false};
    std::optional<Error> serve_error;
    std::thread listener([this, &finished, &serve_error] {
        auto served = Serve();
        if (served.IsErr()) {
            serve_error = served.Error();
        }
        finished = true;
    });
    // stop() is a no-op until the accept loop is running.
    WaitUntilReady();

    while (!finished && !should_stop()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!finished) {
        LogInfo(kComponent, "Shutting down server...");
        Stop();
    }
    listener.join();

    if (serve_error) {
        return Result<void, Error>::Err(*serve_error);
    }
    LogInfo(kComponent, "Server shutdown gracefully");
    return Result<void, Error>::Ok();
}

void HttpTransport::LogBanner() const {
    const auto scheme = Scheme();
    const auto url = scheme + "://localhost:" + std::to_string(bound_port_);

    LogInfo(kComponent, "Favorite Colors MCP Server starting on " + url);
    LogInfo(kComponent, "Transport: StreamableHttp over " + ToUpper(scheme));
    LogInfo(kComponent, "Endpoints:");
    LogInfo(kComponent, "  GET  / - Server information");
    LogInfo(kComponent, "  POST /mcp - StreamableHttp endpoint for MCP Inspector");
    LogInfo(kComponent, "  GET  /.well-known/oauth-protected-resource - OAuth resource info");
    LogInfo(kComponent, "MCP Inspector URL: " + url + "/mcp");
    LogInfo(kComponent, "Available tools: add_color, get_colors, remove_color, clear_colors");
    if (options_.use_https) {
        LogInfo(kComponent, "Using TLS certificate: " + options_.cert_file);
        LogInfo(kComponent, "Using TLS private key: " + options_.key_file);
    }
    LogInfo(kComponent, "Press CTRL+C to shutdown gracefully...");
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------
void HttpTransport::HandleMcp(const httplib::Request& req,
                              httplib::Response& res) const {
    ApplyCorsHeaders(res);
    res.set_header("Cache-Control", "no-cache");

    if (req.method == "OPTIONS") {
        res.status = 200;
        return;
    }
    if (req.method != "POST") {
        MethodNotAllowed(req, res);
        return;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::exception& e) {
        LogWarn(kComponent, std::string("JSON decode error: ") + e.what());
        ParseErrorResponse(res, e.what());
        return;
    }

    auto request = ParseRequest(message);
    if (request.IsErr()) {
        LogWarn(kComponent, "JSON decode error: " + request.Error());
        ParseErrorResponse(res, request.Error());
        return;
    }

    const auto& decoded = request.Value();
    LogInfo(kComponent, "Processing MCP request: method=" + decoded.method +
                            ", id=" + (decoded.id ? decoded.id->dump() : "<none>"));

    auto response = server_.HandleRequest(decoded);

    LogDebug(kComponent, "Sending MCP response for method=" + decoded.method);
    res.status = 200;
    res.set_content(response.dump(), "application/json");
}

void HttpTransport::HandleOAuthResource(const httplib::Request& req,
                                        httplib::Response& res) const {
    ApplyCorsHeaders(res);
    if (req.method == "OPTIONS") {
        res.status = 200;
        return;
    }

    // No authentication is required.
    nlohmann::json body = {
        {"resource", "mcp-server"},
        {"scopes", nlohmann::json::array({"mcp:read", "mcp:write"})},
        {"auth", false}
    };
    res.set_content(body.dump(), "application/json");
}

void HttpTransport::HandleRoot(const httplib::Request&,
                               httplib::Response& res) const {
    ApplyCorsHeaders(res);

    const auto scheme = Scheme();
    const auto upper = ToUpper(scheme);
    const auto port = std::to_string(bound_port_ != 0 ? bound_port_
                                                      : options_.listen.port);
    const auto mcp_url = scheme + "://localhost:" + port + "/mcp";

    std::string html;
    html += R"(<!DOCTYPE html>
<html>
<head>
    <title>Favorite Colors MCP Server</title>
    <style>
        body { font-family: Arial, sans-serif; margin: 40px; }
        .container { max-width: 800px; margin: 0 auto; }
        .endpoint { background: #f5f5f5; padding: 15px; margin: 10px 0; border-radius: 5px; }
        .method { color: #0066cc; font-weight: bold; }
        .status { padding: 10px; margin: 10px 0; border-radius: 5px; }
        .success { background: #d4edda; color: #155724; }
        pre { background: #000; color: #0f0; padding: 10px; border-radius: 3px; overflow-x: auto; }
    </style>
</head>
<body>
    <div class="container">
        <h1>Favorite Colors MCP Server</h1>
        <div class="status success">
            Server is running with StreamableHttp transport over )";
    html += upper;
    html += R"(
        </div>

        <h2>MCP Inspector Setup</h2>
        <p>To connect with MCP Inspector, use:</p>
        <pre>npx @modelcontextprotocol/inspector</pre>
        <p>Then configure:</p>
        <ul>
            <li><strong>Transport Type:</strong> StreamableHttp</li>
            <li><strong>URL:</strong> )";
    html += mcp_url;
    html += R"(</li>
        </ul>

        <h2>Endpoints</h2>

        <div class="endpoint">
            <h3><span class="method">POST</span> /mcp</h3>
            <p>StreamableHttp endpoint for MCP Inspector (JSON over )";
    html += upper;
    html += R"()</p>
        </div>

        <div class="endpoint">
            <h3><span class="method">GET</span> /.well-known/oauth-protected-resource</h3>
            <p>OAuth resource info</p>
        </div>

        <h2>Available Tools</h2>
        <ul>
            <li><strong>add_color</strong> - Add a color to your favorites list</li>
            <li><strong>get_colors</strong> - Get all favorite colors</li>
            <li><strong>remove_color</strong> - Remove a color from your favorites list</li>
            <li><strong>clear_colors</strong> - Clear all favorite colors</li>
        </ul>
    </div>
</body>
</html>
)";

    res.set_content(html, "text/html");
}

} // namespace favorite_colors
