#include "server.hpp"

#include <iostream>
#include <utility>

namespace guidctl {

static std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

// "mock://test.net/guid/AB?x=1#f" -> "mock://test.net/guid/AB"
static std::string strip_query(const std::string& url) {
    size_t cut = url.find_first_of("?#");
    return cut == std::string::npos ? url : url.substr(0, cut);
}

MockServer::MockServer(std::string scheme, std::string host)
    : scheme_(std::move(scheme)), host_(std::move(host)) {}

void MockServer::install() {
    if (installed_) return;

    std::regex pattern("^" + regex_escape(scheme_) + "://" + regex_escape(host_) +
                       "/guid(/[^/]*)*$");
    routes_.push_back({"GET", pattern, respond_read});
    routes_.push_back({"POST", pattern, respond_create_update});
    routes_.push_back({"DELETE", pattern, respond_delete});
    installed_ = true;

    if (verbose_)
        std::cerr << "[mock] Installed " << routes_.size() << " routes for "
                  << base_url() << "\n";
}

const MockRoute& MockServer::match(const std::string& method,
                                   const std::string& url) const {
    std::string target = strip_query(url);
    for (const auto& route : routes_) {
        if (route.method == method && std::regex_match(target, route.pattern))
            return route;
    }
    throw MockRouteError(method, url);
}

HttpResponse MockServer::send(const std::string& method,
                              const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& /*headers*/,
                              long /*timeout_seconds*/) {
    const MockRoute& route = match(method, url);

    MockRequest request;
    request.method = method;
    request.url = url;
    request.path = url_path(strip_query(url));
    request.body = body;

    HttpResponse resp = route.responder(request);
    if (verbose_)
        std::cerr << "[mock] " << method << " " << request.path << " -> "
                  << resp.status_code << " " << resp.reason << "\n";
    return resp;
}

} // namespace guidctl
