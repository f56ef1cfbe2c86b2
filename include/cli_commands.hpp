#pragma once

#include <iosfwd>
#include <optional>

#include "http_transport.hpp"
#include "options.hpp"

namespace cli {

/**
 * @brief Handle `--help` and `--version`.
 *
 * Returns `0` when one of them was printed, or `std::nullopt` so the caller
 * continues with a delivery.
 */
std::optional<int> handle_info_queries(const Options& opts, const char* prog, std::ostream& out);

/**
 * @brief Open the delivery log when `--log-file` was given.
 */
void setup_logging(const Options& opts);

/**
 * @brief Build the notification from @a opts and deliver it once.
 *
 * Prints the audit trail and the outcome to @a out. Returns `0` when the
 * receiver answered with HTTP 200 (or on a dry run) and `1` for any other
 * status or a transport error.
 */
int run_delivery(const Options& opts, HttpTransport& transport, std::ostream& out);

} // namespace cli
