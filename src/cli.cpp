#include "cli.hpp"
#include "http.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <initializer_list>

namespace guidctl {

static constexpr size_t kGuidLength = 32;

std::string validate_guid(const std::string& guid) {
    if (guid.size() != kGuidLength)
        throw UsageError("GUID needs to be 32 characters");
    if (!is_upper_hex(guid))
        throw UsageError("GUID is not a upper-case hexadecimal number");
    return guid;
}

std::string validate_future_time(const std::string& epoch_time, uint64_t now) {
    std::string t = trim(epoch_time);
    if (!is_integer(t))
        throw UsageError("expire must be an integer (seconds since epoch): " + epoch_time);
    if (t[0] == '-')
        throw UsageError("Specified time is not in the future");

    errno = 0;
    unsigned long long value = std::strtoull(t.c_str(), nullptr, 10);
    // Out of range means further in the future than we can represent.
    if (errno != ERANGE && value < now)
        throw UsageError("Specified time is not in the future");
    return epoch_time;
}

std::string validate_url(const std::string& url) {
    if (url_scheme(url).empty())
        throw UsageError("HTTP scheme needs to be provided, e.g. https://<host> or http://<host>");
    return url;
}

// ── Usage text ──────────────────────────────────────────────────

std::string usage() {
    return std::string("Usage: guidctl [--version] [-h] <command> [options]\n")
        + "\n"
        + "GUID client\n"
        + "\n"
        + "Commands ('<command> -h' for further help):\n"
        + "  create               Create a GUID\n"
        + "  read                 Read a GUID\n"
        + "  update               Update a GUID\n"
        + "  delete               Delete a GUID\n"
        + "\n"
        + "Options:\n"
        + "  --version            Show version and exit\n"
        + "  -v, --verbose        Log requests to stderr\n"
        + "  -h, --help           Show this help\n"
        + "\n"
        + "Environment variables:\n"
        + "  GUIDCTL_URL          Endpoint URL used when --url is not given\n"
        + "  GUIDCTL_TIMEOUT      Request timeout in seconds (default: 30)\n"
        + "\n"
        + "A mock://test.net URL answers requests in-process. GUIDs starting\n"
        + "with 9 simulate a server error (503), with 8 a client error (404).\n";
}

std::string command_usage(Operation op) {
    std::string name = operation_name(op);
    std::string text = "Usage: guidctl " + name;
    switch (op) {
        case Operation::Create:
            text += " -u USER [-g GUID] [-e EXPIRE] --url URL\n\n"
                    "  -u, --user USER      User (required)\n"
                    "  -g, --guid GUID      GUID to create; generated by the server if omitted\n"
                    "  -e, --expire EXPIRE  Expire time for the GUID (seconds since epoch)\n";
            break;
        case Operation::Read:
            text += " -g GUID --url URL\n\n"
                    "  -g, --guid GUID      GUID (required)\n";
            break;
        case Operation::Update:
            text += " -g GUID -e EXPIRE --url URL\n\n"
                    "  -g, --guid GUID      GUID (required)\n"
                    "  -e, --expire EXPIRE  Expire time for the GUID (required)\n";
            break;
        case Operation::Delete:
            text += " -g GUID --url URL\n\n"
                    "  -g, --guid GUID      GUID (required)\n";
            break;
    }
    text += "  --url URL            Endpoint URL\n"
            "  -v, --verbose        Log requests to stderr\n"
            "  -h, --help           Show this help\n";
    return text;
}

// ── Parsing ─────────────────────────────────────────────────────

static bool parse_operation(const std::string& word, Operation& op) {
    if (word == "create") { op = Operation::Create; return true; }
    if (word == "read")   { op = Operation::Read;   return true; }
    if (word == "update") { op = Operation::Update; return true; }
    if (word == "delete") { op = Operation::Delete; return true; }
    return false;
}

// Matches "-s VALUE", "--long VALUE" and "--long=VALUE".
// Returns false when argv[i] is not this option.
static bool take_value(int argc, const char* const argv[], int& i,
                       const char* short_name, const char* long_name,
                       std::string& value) {
    const char* arg = argv[i];
    size_t long_len = std::strlen(long_name);
    if (std::strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        value = arg + long_len + 1;
        return true;
    }
    bool matches = std::strcmp(arg, long_name) == 0 ||
                   (short_name && std::strcmp(arg, short_name) == 0);
    if (!matches) return false;
    if (i + 1 >= argc)
        throw UsageError(std::string("argument ") + long_name + ": expected one argument");
    value = argv[++i];
    return true;
}

static bool allowed(Operation op, std::initializer_list<Operation> ops) {
    for (Operation o : ops)
        if (o == op) return true;
    return false;
}

CliOptions parse_args(int argc, const char* const argv[],
                      const std::string& default_url, uint64_t now) {
    CliOptions opts;
    std::string url;
    std::string value;
    Operation& op = opts.request.operation;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            opts.show_help = true;
            return opts;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (!opts.has_command) {
            if (std::strcmp(arg, "--version") == 0) {
                opts.show_version = true;
                return opts;
            }
            if (!parse_operation(arg, op))
                throw UsageError(std::string("invalid command: '") + arg +
                                 "' (choose from 'create', 'read', 'update', 'delete')");
            opts.has_command = true;
        } else if (take_value(argc, argv, i, nullptr, "--url", value)) {
            url = validate_url(value);
        } else if (take_value(argc, argv, i, "-g", "--guid", value)) {
            opts.request.guid = validate_guid(value);
        } else if (allowed(op, {Operation::Create}) &&
                   take_value(argc, argv, i, "-u", "--user", value)) {
            opts.request.user = value;
        } else if (allowed(op, {Operation::Create, Operation::Update}) &&
                   take_value(argc, argv, i, "-e", "--expire", value)) {
            opts.request.expire = validate_future_time(value, now);
        } else {
            throw UsageError(std::string("unrecognized argument for ") +
                             operation_name(op) + ": " + arg);
        }
    }

    if (!opts.has_command)
        throw UsageError("a command is required (create, read, update, delete)");

    if (url.empty()) {
        if (default_url.empty())
            throw UsageError("the following arguments are required: --url");
        url = validate_url(default_url);
    }
    opts.request.url = url;

    if (op == Operation::Create && !opts.request.user)
        throw UsageError("the following arguments are required: -u/--user");
    if (op != Operation::Create && !opts.request.guid)
        throw UsageError("the following arguments are required: -g/--guid");
    if (op == Operation::Update && !opts.request.expire)
        throw UsageError("the following arguments are required: -e/--expire");

    return opts;
}

} // namespace guidctl
