#ifndef WEBHOOK_SENDER_HPP
#define WEBHOOK_SENDER_HPP

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>

#include "deploy_notification.hpp"
#include "http_transport.hpp"

/**
 * @brief Delivers a signed deployment notification to one webhook URL.
 *
 * The sender serializes the notification, signs the exact serialized bytes,
 * echoes the URL, signature and an indented payload to @c out, then issues a
 * single POST. It never retries.
 */
class WebhookSender {
  public:
    WebhookSender(HttpTransport& transport, std::ostream& out,
                  std::chrono::seconds timeout = std::chrono::seconds(30));

    /**
     * @brief Sign and POST @p payload to @p url.
     *
     * @return The response or a transport error. Returns `std::nullopt` only
     *         in dry-run mode, when nothing was sent.
     */
    std::optional<DeliveryResult> send(const std::string& url, const DeployNotification& payload,
                                       const std::string& secret) const;

    void set_dry_run(bool enable) { dry_run_ = enable; }

  private:
    HttpTransport& transport_;
    std::ostream& out_;
    std::chrono::seconds timeout_;
    bool dry_run_ = false;
};

#endif // WEBHOOK_SENDER_HPP
