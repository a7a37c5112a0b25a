#include "cli.hpp"
#include "config.hpp"
#include "guid_api.hpp"
#include "http.hpp"
#include "mock/server.hpp"
#include "util.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) try {
    auto config = guidctl::Config::load();

    guidctl::CliOptions opts;
    try {
        opts = guidctl::parse_args(argc, argv, config.url, guidctl::epoch_seconds());
    } catch (const guidctl::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Run 'guidctl -h' for usage.\n";
        return 2;
    }

    if (opts.show_version) {
        std::cout << "guidctl " << guidctl::kVersion << "\n";
        return 0;
    }
    if (opts.show_help) {
        std::cout << (opts.has_command ? guidctl::command_usage(opts.request.operation)
                                       : guidctl::usage());
        return 0;
    }

    // One client per invocation: either the in-process mock (for mock://
    // URLs, so the tool can be demoed and tested) or the real transport.
    std::unique_ptr<guidctl::HttpClient> http_client;
    if (config.is_simulated(opts.request.url)) {
        auto mock = std::make_unique<guidctl::MockServer>(config.mock.scheme,
                                                          config.mock.host);
        mock->set_verbose(opts.verbose);
        mock->install();
        http_client = std::move(mock);
    } else {
        guidctl::http_init();
        http_client = std::make_unique<guidctl::PlatformHttpClient>();
    }

    guidctl::GuidClient client(*http_client, config.timeout);
    client.set_verbose(opts.verbose);
    auto outcome = client.perform(opts.request);
    int rc = guidctl::report(outcome, std::cout, std::cerr);

    if (!config.is_simulated(opts.request.url))
        guidctl::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
