#include "deploy_notification.hpp"

#include <utility>

DeployNotification make_notification(std::string hook_id, std::string sha, std::string ref,
                                     std::string repository, std::string sender,
                                     std::string workflow_run_id) {
    DeployNotification n;
    n.hook_id = std::move(hook_id);
    n.sha = std::move(sha);
    n.ref = std::move(ref);
    n.repository = std::move(repository);
    n.sender = std::move(sender);
    n.triggered_by = TRIGGERED_BY;
    n.workflow_run_id = std::move(workflow_run_id);
    return n;
}

nlohmann::ordered_json to_json(const DeployNotification& n) {
    nlohmann::ordered_json j;
    j["hook_id"] = n.hook_id;
    j["sha"] = n.sha;
    j["ref"] = n.ref;
    j["repository"] = n.repository;
    j["sender"] = n.sender;
    j["triggered_by"] = n.triggered_by;
    j["workflow_run_id"] = n.workflow_run_id;
    return j;
}

std::string serialize_compact(const DeployNotification& n) {
    return to_json(n).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

std::string serialize_pretty(const DeployNotification& n) {
    return to_json(n).dump(2, ' ', true, nlohmann::json::error_handler_t::replace);
}
