#pragma once
#include "../http.hpp"
#include <optional>
#include <string>

namespace guidctl {

// Placeholder values the simulated API fills in when a request leaves them out.
constexpr const char* kMockPlaceholderGuid = "77777777777777";
constexpr const char* kMockPlaceholderExpire = "999999999999";
constexpr const char* kMockPlaceholderUser = "mock generated";
constexpr const char* kMockReadExpire = "1234123123123";
constexpr const char* kMockReadUser = "foo";

constexpr const char* kMockServerErrorReason = "mock server error test";
constexpr const char* kMockClientErrorReason = "mock client error test";

// One intercepted outbound request, as seen by a responder.
struct MockRequest {
    std::string method;
    std::string url;
    std::string path; // "/guid" or "/guid/<id>", query and fragment removed
    std::string body;
};

// Responders are pure: same request in, byte-identical response out.
using MockResponder = HttpResponse (*)(const MockRequest& request);

// Extract the GUID segment from a "/guid" or "/guid/<id>" path.
// Returns nullopt for "/guid". Throws std::invalid_argument for any
// other prefix, an empty segment or extra segments.
std::optional<std::string> parse_guid_path(const std::string& path);

// Status and reason selected by the GUID's first character:
// '9' -> 503, '8' -> 404, anything else -> 200. Body is left empty.
HttpResponse mock_status_for(const std::string& guid);

// GET /guid/<id>
HttpResponse respond_read(const MockRequest& request);

// POST /guid and POST /guid/<id>
HttpResponse respond_create_update(const MockRequest& request);

// DELETE /guid/<id>
HttpResponse respond_delete(const MockRequest& request);

} // namespace guidctl
