#ifndef DEPLOY_NOTIFICATION_HPP
#define DEPLOY_NOTIFICATION_HPP
#include <string>
#include <nlohmann/json.hpp>

inline constexpr const char* DEFAULT_REF = "refs/heads/main";
inline constexpr const char* DEFAULT_REPOSITORY = "org/repo";
inline constexpr const char* DEFAULT_SENDER = "github-actions";
inline constexpr const char* TRIGGERED_BY = "github-actions";

/**
 * @brief Deployment request delivered to the webhook receiver.
 *
 * Built once from the command line and never modified afterwards. Every
 * field is serialized, in declaration order, even when empty.
 */
struct DeployNotification {
    std::string hook_id;
    std::string sha;
    std::string ref = DEFAULT_REF;
    std::string repository = DEFAULT_REPOSITORY;
    std::string sender = DEFAULT_SENDER;
    std::string triggered_by = TRIGGERED_BY;
    std::string workflow_run_id;
};

/**
 * @brief Build a notification, pinning `triggered_by` to its fixed value.
 */
DeployNotification make_notification(std::string hook_id, std::string sha, std::string ref,
                                     std::string repository, std::string sender,
                                     std::string workflow_run_id);

/**
 * @brief Convert a notification to an insertion-ordered JSON object.
 *
 * Keys appear as hook_id, sha, ref, repository, sender, triggered_by,
 * workflow_run_id.
 */
nlohmann::ordered_json to_json(const DeployNotification& n);

/**
 * @brief Serialize without whitespace; these are the bytes that get signed
 * and sent.
 *
 * Non-ASCII text is written as `\uXXXX` escapes and invalid UTF-8 is
 * replaced with U+FFFD.
 */
std::string serialize_compact(const DeployNotification& n);

/** @brief Two-space indented rendering for the console audit trail. */
std::string serialize_pretty(const DeployNotification& n);

#endif // DEPLOY_NOTIFICATION_HPP
