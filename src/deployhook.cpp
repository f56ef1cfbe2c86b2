/**
 * @file deployhook.cpp
 * @brief CLI entry point that sends one signed deployment webhook.
 *
 * Parses the command line, builds the deployment notification, signs it with
 * HMAC-SHA256 and POSTs it with libcurl. The exit status is 0 only when the
 * receiver answers HTTP 200.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "options.hpp"

/**
 * @brief Application entry point.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 * @return int Zero when the webhook was accepted with HTTP 200 or when
 *             printing help/version; 1 on usage errors, rejected deliveries,
 *             transport failures and unexpected errors.
 */
#ifndef DEPLOYHOOK_NO_MAIN
int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0], std::cerr);
        return 1;
    }
    try {
        if (auto rc = cli::handle_info_queries(opts, argv[0], std::cout); rc)
            return *rc;
        cli::setup_logging(opts);
        CurlGlobalGuard curl_guard;
        CurlTransport transport(opts.proxy_url);
        int rc = cli::run_delivery(opts, transport, std::cout);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "❌ Error sending webhook: " << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // DEPLOYHOOK_NO_MAIN
