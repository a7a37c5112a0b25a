#include "guid_api.hpp"

#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace guidctl {

std::string operation_name(Operation op) {
    switch (op) {
        case Operation::Create: return "create";
        case Operation::Read:   return "read";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
    }
    return "unknown";
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string out = base;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out + path;
}

Outcome execute(const std::string& url, const std::function<HttpResponse()>& request) {
    Outcome outcome;
    outcome.url = url;

    HttpResponse resp;
    try {
        resp = request();
    } catch (const std::exception& e) {
        outcome.kind = Outcome::Kind::TransportError;
        outcome.message = e.what();
        return outcome;
    }

    outcome.status_code = resp.status_code;
    outcome.reason = resp.reason.empty() ? default_reason(resp.status_code) : resp.reason;
    outcome.body = resp.body;

    if (resp.status_code == 0) {
        outcome.kind = Outcome::Kind::TransportError;
        outcome.message = resp.error.empty()
            ? "no response from " + url
            : resp.error + " (" + url + ")";
    } else if (resp.status_code >= 200 && resp.status_code < 300) {
        outcome.kind = Outcome::Kind::Success;
    } else {
        outcome.kind = Outcome::Kind::HttpError;
        std::string klass = resp.status_code >= 500 ? "Server Error"
                          : resp.status_code >= 400 ? "Client Error"
                          : "Unexpected Status";
        outcome.message = std::to_string(resp.status_code) + " " + klass + ": " +
                          outcome.reason + " for url: " + url;
    }
    return outcome;
}

int report(const Outcome& outcome, std::ostream& out, std::ostream& err) {
    if (outcome.kind == Outcome::Kind::Success) {
        out << outcome.body << "\n";
        out << "Success\n";
        return 0;
    }
    err << outcome.message << "\n";
    return 1;
}

// ── GuidClient ───────────────────────────────────────────────────

GuidClient::GuidClient(HttpClient& http, long timeout_seconds)
    : http_(http), timeout_seconds_(timeout_seconds) {}

Outcome GuidClient::call(const std::string& method, const std::string& url,
                         const std::string& body) {
    if (verbose_)
        std::cerr << "[guid] " << method << " " << url << "\n";

    std::vector<Header> headers;
    if (method == "POST")
        headers.emplace_back("Content-Type", "application/json");
    headers.emplace_back("Accept", "application/json");

    return execute(url, [&]() {
        return http_.send(method, url, body, headers, timeout_seconds_);
    });
}

Outcome GuidClient::create(const std::string& url, const std::string& user,
                           const std::optional<std::string>& guid,
                           const std::optional<std::string>& expire) {
    nlohmann::json body = {{"user", user}};
    if (!guid) {
        // The server generates the GUID; expire is not part of this call.
        if (expire)
            std::cerr << "[guid] --expire is ignored when creating without --guid\n";
        return call("POST", join_url(url, "/guid"), body.dump());
    }
    if (expire) body["expire"] = *expire;
    return call("POST", join_url(url, "/guid/" + *guid), body.dump());
}

Outcome GuidClient::read(const std::string& url, const std::string& guid) {
    return call("GET", join_url(url, "/guid/" + guid), "");
}

Outcome GuidClient::update(const std::string& url, const std::string& guid,
                           const std::string& expire) {
    nlohmann::json body = {{"expire", expire}};
    return call("POST", join_url(url, "/guid/" + guid), body.dump());
}

Outcome GuidClient::remove(const std::string& url, const std::string& guid) {
    return call("DELETE", join_url(url, "/guid/" + guid), "");
}

static const std::string& require_field(const std::optional<std::string>& field,
                                        Operation op, const char* name) {
    if (!field)
        throw std::invalid_argument(operation_name(op) + " requires --" + name);
    return *field;
}

Outcome GuidClient::perform(const GuidRequest& request) {
    const Operation op = request.operation;
    switch (op) {
        case Operation::Create:
            return create(request.url, require_field(request.user, op, "user"),
                          request.guid, request.expire);
        case Operation::Read:
            return read(request.url, require_field(request.guid, op, "guid"));
        case Operation::Update:
            return update(request.url, require_field(request.guid, op, "guid"),
                          require_field(request.expire, op, "expire"));
        case Operation::Delete:
            return remove(request.url, require_field(request.guid, op, "guid"));
    }
    throw std::invalid_argument("unknown operation");
}

} // namespace guidctl
