#pragma once
#include "../http.hpp"
#include "responders.hpp"
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace guidctl {

// Raised when an intercepted request matches no installed route.
// Indicates a configuration or programming error, never a server reply.
class MockRouteError : public std::runtime_error {
public:
    MockRouteError(const std::string& method, const std::string& url)
        : std::runtime_error("no mock route for " + method + " " + url) {}
};

struct MockRoute {
    std::string method;
    std::regex pattern; // matched against the whole URL minus query/fragment
    MockResponder responder;
};

// In-process stand-in for the GUID API. Requests sent through it are
// answered by the responders in mock/responders.hpp and never touch the
// network. Routes are bound by install(); until then every request fails
// with MockRouteError.
class MockServer : public HttpClient {
public:
    explicit MockServer(std::string scheme = "mock", std::string host = "test.net");

    // Bind GET/POST/DELETE on <scheme>://<host>/guid[/<id>]. Idempotent.
    void install();
    bool installed() const { return installed_; }

    const std::vector<MockRoute>& routes() const { return routes_; }
    std::string base_url() const { return scheme_ + "://" + host_; }

    // First route whose method and pattern match. Throws MockRouteError.
    const MockRoute& match(const std::string& method, const std::string& url) const;

    HttpResponse send(const std::string& method,
                      const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    std::string scheme_;
    std::string host_;
    std::vector<MockRoute> routes_;
    bool installed_ = false;
    bool verbose_ = false;
};

} // namespace guidctl
