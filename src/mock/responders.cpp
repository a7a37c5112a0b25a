#include "responders.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace guidctl {

static const std::string kGuidRoot = "/guid";

std::optional<std::string> parse_guid_path(const std::string& path) {
    if (path == kGuidRoot) return std::nullopt;

    const std::string prefix = kGuidRoot + "/";
    if (path.compare(0, prefix.size(), prefix) != 0)
        throw std::invalid_argument("mock: unexpected path '" + path +
                                    "', expected /guid or /guid/<id>");

    std::string guid = path.substr(prefix.size());
    if (guid.empty())
        throw std::invalid_argument("mock: empty GUID segment in path '" + path + "'");
    if (guid.find('/') != std::string::npos)
        throw std::invalid_argument("mock: too many segments in path '" + path + "'");
    return guid;
}

HttpResponse mock_status_for(const std::string& guid) {
    HttpResponse resp;
    char first = guid.empty() ? '\0' : guid[0];
    if (first == '9') {
        resp.status_code = 503;
        resp.reason = kMockServerErrorReason;
    } else if (first == '8') {
        resp.status_code = 404;
        resp.reason = kMockClientErrorReason;
    } else {
        resp.status_code = 200;
        resp.reason = default_reason(200);
    }
    return resp;
}

static std::string require_guid(const MockRequest& request) {
    auto guid = parse_guid_path(request.path);
    if (!guid)
        throw std::invalid_argument("mock: " + request.method + " " + request.path +
                                    " requires a GUID in the path");
    return *guid;
}

HttpResponse respond_read(const MockRequest& request) {
    std::string guid = require_guid(request);
    HttpResponse resp = mock_status_for(guid);
    // The body is produced even for error statuses.
    nlohmann::json body = {
        {"guid", guid},
        {"expire", kMockReadExpire},
        {"user", kMockReadUser}
    };
    resp.body = body.dump();
    return resp;
}

HttpResponse respond_create_update(const MockRequest& request) {
    auto path_guid = parse_guid_path(request.path);
    std::string guid = path_guid ? *path_guid : kMockPlaceholderGuid;

    nlohmann::json body = nlohmann::json::object();
    if (!request.body.empty()) {
        try {
            body = nlohmann::json::parse(request.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument(std::string("mock: request body is not JSON: ") + e.what());
        }
        if (!body.is_object())
            throw std::invalid_argument("mock: request body is not a JSON object");
    }

    // Echo what the caller sent; back-fill only what is missing.
    if (!body.contains("expire") || body["expire"].is_null())
        body["expire"] = kMockPlaceholderExpire;
    if (!body.contains("user") || body["user"].is_null())
        body["user"] = kMockPlaceholderUser;
    body["guid"] = guid;

    HttpResponse resp = mock_status_for(guid);
    resp.body = body.dump();
    return resp;
}

HttpResponse respond_delete(const MockRequest& request) {
    // Delete generates no output, whatever the status.
    return mock_status_for(require_guid(request));
}

} // namespace guidctl
