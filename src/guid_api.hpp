#pragma once
#include "http.hpp"
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace guidctl {

enum class Operation { Create, Read, Update, Delete };

std::string operation_name(Operation op);

// One API call, already validated by the command line layer.
struct GuidRequest {
    Operation operation = Operation::Read;
    std::string url; // endpoint base, e.g. "https://api.example.com" or "mock://test.net"
    std::optional<std::string> guid;
    std::optional<std::string> user;
    std::optional<std::string> expire; // seconds since epoch, as typed
};

// Tagged result of one request, independent of how it gets printed.
struct Outcome {
    enum class Kind { Success, HttpError, TransportError };

    Kind kind = Kind::TransportError;
    std::string url;
    long status_code = 0;
    std::string reason;
    std::string body;
    std::string message; // error text for HttpError / TransportError
};

// Run one request and classify what came back: 2xx is Success, any other
// status is HttpError, and no response (status 0) or an exception thrown by
// the transport is TransportError. Nothing is printed.
Outcome execute(const std::string& url, const std::function<HttpResponse()>& request);

// Print an outcome: body then "Success" on out, or the error text on err.
// Returns the process exit code (0 on success, 1 otherwise).
int report(const Outcome& outcome, std::ostream& out, std::ostream& err);

// "https://h/" + "/guid" -> "https://h/guid"
std::string join_url(const std::string& base, const std::string& path);

// Client for the GUID lifecycle API over any HttpClient (real or simulated).
class GuidClient {
public:
    explicit GuidClient(HttpClient& http, long timeout_seconds = 30);

    // POST /guid (no guid; expire is not sent) or POST /guid/<guid>.
    Outcome create(const std::string& url, const std::string& user,
                   const std::optional<std::string>& guid,
                   const std::optional<std::string>& expire);

    // GET /guid/<guid>
    Outcome read(const std::string& url, const std::string& guid);

    // POST /guid/<guid> with {"expire": ...}
    Outcome update(const std::string& url, const std::string& guid,
                   const std::string& expire);

    // DELETE /guid/<guid>
    Outcome remove(const std::string& url, const std::string& guid);

    // Dispatch on request.operation. Throws std::invalid_argument when a
    // field the operation needs is missing.
    Outcome perform(const GuidRequest& request);

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    Outcome call(const std::string& method, const std::string& url,
                 const std::string& body);

    HttpClient& http_;
    long timeout_seconds_;
    bool verbose_ = false;
};

} // namespace guidctl
