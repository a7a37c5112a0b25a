#pragma once
#include <string>
#include <vector>
#include <utility>

namespace guidctl {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;    // 0 = no response (see error)
    std::string body;
    std::string reason;
    std::string error;
};

// Abstract HTTP client interface (injectable for testing and simulation)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const std::string& method,
                              const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse send(const std::string& method,
                      const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse send(const std::string& method,
                      const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// Reason phrase for a status code ("OK", "Not Found", ...); empty if unknown.
std::string default_reason(long status_code);

// "https://host:8443/guid/AB?x=1" -> "/guid/AB?x=1"; "/" when the URL has no path.
std::string url_path(const std::string& url);

// Scheme before "://", empty if absent.
std::string url_scheme(const std::string& url);

} // namespace guidctl
