#include "http.hpp"

namespace guidctl {

std::string default_reason(long status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

std::string url_scheme(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return "";
    return url.substr(0, scheme_end);
}

std::string url_path(const std::string& url) {
    size_t scheme_end = url.find("://");
    size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    if (path_start == std::string::npos) return "/";
    return url.substr(path_start);
}

} // namespace guidctl
