#include "webhook_sender.hpp"

#include <ostream>

#include "logger.hpp"
#include "signature.hpp"

WebhookSender::WebhookSender(HttpTransport& transport, std::ostream& out,
                             std::chrono::seconds timeout)
    : transport_(transport), out_(out), timeout_(timeout) {}

std::optional<DeliveryResult> WebhookSender::send(const std::string& url,
                                                  const DeployNotification& payload,
                                                  const std::string& secret) const {
    // The signature must cover exactly the bytes that go on the wire.
    const std::string body = serialize_compact(payload);
    const std::string signature = sign_payload(body, secret);
    const HeaderList headers{{"Content-Type", "application/json"},
                             {SIGNATURE_HEADER, signature}};

    out_ << "Webhook URL: " << url << "\n";
    out_ << "Signature: " << signature << "\n";
    out_ << "Payload:\n" << serialize_pretty(payload) << std::endl;

    const std::map<std::string, std::string> ctx{
        {"hook_id", payload.hook_id}, {"sha", payload.sha}, {"url", url}};
    if (dry_run_) {
        log_info("Dry run, webhook not sent", ctx);
        return std::nullopt;
    }

    log_debug("Sending webhook", {{"bytes", std::to_string(body.size())}, {"url", url}});
    DeliveryResult result = transport_.post(url, body, headers, timeout_);
    if (const auto* resp = std::get_if<HttpResponse>(&result)) {
        auto fields = ctx;
        fields["status"] = std::to_string(resp->status);
        if (resp->status == 200)
            log_info("Webhook delivered", fields);
        else
            log_warning("Webhook rejected", fields);
    } else {
        auto fields = ctx;
        fields["error"] = std::get<TransportError>(result).message;
        log_error("Webhook transport failure", fields);
    }
    return result;
}
