#include "cli_commands.hpp"

#include <ostream>
#include <variant>

#include "deploy_notification.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "version.hpp"
#include "webhook_sender.hpp"

namespace cli {

std::optional<int> handle_info_queries(const Options& opts, const char* prog, std::ostream& out) {
    if (opts.show_help) {
        print_help(prog, out);
        return 0;
    }
    if (opts.print_version) {
        out << DEPLOYHOOK_VERSION << "\n";
        return 0;
    }
    return std::nullopt;
}

void setup_logging(const Options& opts) {
    const auto& lg = opts.logging;
    if (lg.log_file.empty())
        return;
    if (!init_logger(lg.log_file, lg.log_level, lg.max_log_size, lg.max_log_files))
        return;
    set_json_logging(lg.json_log);
    set_log_compression(lg.compress_logs);
}

int run_delivery(const Options& opts, HttpTransport& transport, std::ostream& out) {
    DeployNotification payload = make_notification(opts.hook_id, opts.sha, opts.ref,
                                                   opts.repository, opts.sender,
                                                   opts.workflow_run_id);
    WebhookSender sender(transport, out, opts.timeout);
    sender.set_dry_run(opts.dry_run);

    auto result = sender.send(opts.url, payload, opts.secret);
    if (!result) {
        out << "Dry run: webhook not sent" << std::endl;
        return 0;
    }
    if (const auto* err = std::get_if<TransportError>(&*result)) {
        out << "❌ Error sending webhook: " << err->message << std::endl;
        return 1;
    }
    const auto& resp = std::get<HttpResponse>(*result);
    out << "\nHTTP Status: " << resp.status << "\n";
    out << "Response: " << resp.body << std::endl;
    if (resp.status != 200) {
        out << "❌ Webhook failed with status " << resp.status << "\n";
        out << "Response body: " << resp.body << std::endl;
        return 1;
    }
    out << "✅ Webhook sent successfully" << std::endl;
    return 0;
}

} // namespace cli
