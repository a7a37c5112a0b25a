#pragma once
#include "guid_api.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace guidctl {

constexpr const char* kVersion = "0.1";

// Bad command line: unknown option, missing value, or a value that fails
// validation. Raised before any request is built.
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct CliOptions {
    GuidRequest request;
    bool verbose = false;
    bool show_version = false;
    bool show_help = false;
    bool has_command = false; // help for request.operation rather than top level
};

// Validators shared by the parser; each returns its input or throws UsageError.
std::string validate_guid(const std::string& guid);
std::string validate_future_time(const std::string& epoch_time, uint64_t now);
std::string validate_url(const std::string& url);

// Parse argv. default_url is used when --url is absent (empty = required).
// now is the reference time for --expire.
CliOptions parse_args(int argc, const char* const argv[],
                      const std::string& default_url, uint64_t now);

std::string usage();
std::string command_usage(Operation op);

} // namespace guidctl
