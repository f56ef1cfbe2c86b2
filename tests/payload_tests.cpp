#include "test_common.hpp"
#include <nlohmann/json.hpp>

TEST_CASE("compact payload matches the documented example byte for byte") {
    auto n = make_notification("deploy-staging", "abc1234567890", DEFAULT_REF,
                               DEFAULT_REPOSITORY, DEFAULT_SENDER, "");
    REQUIRE(serialize_compact(n) ==
            "{\"hook_id\":\"deploy-staging\",\"sha\":\"abc1234567890\",\"ref\":\"refs/heads/"
            "main\",\"repository\":\"org/repo\",\"sender\":\"github-actions\",\"triggered_by\":"
            "\"github-actions\",\"workflow_run_id\":\"\"}");
}

TEST_CASE("payload keeps all seven keys in fixed order") {
    auto n = make_notification("h", "s", "refs/tags/v1", "acme/api", "bot", "99");
    auto j = nlohmann::ordered_json::parse(serialize_compact(n));
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it)
        keys.push_back(it.key());
    REQUIRE(keys == std::vector<std::string>{"hook_id", "sha", "ref", "repository", "sender",
                                             "triggered_by", "workflow_run_id"});
    for (auto it = j.begin(); it != j.end(); ++it)
        REQUIRE(it.value().is_string());
    REQUIRE(j["ref"] == "refs/tags/v1");
    REQUIRE(j["workflow_run_id"] == "99");
}

TEST_CASE("triggered_by stays fixed whatever the sender") {
    auto n = make_notification("h", "s", DEFAULT_REF, DEFAULT_REPOSITORY, "alice", "");
    auto j = to_json(n);
    REQUIRE(j["sender"] == "alice");
    REQUIRE(j["triggered_by"] == "github-actions");
}

TEST_CASE("default-constructed notification carries documented defaults") {
    DeployNotification n;
    auto j = to_json(n);
    REQUIRE(j.size() == 7);
    REQUIRE(j["ref"] == "refs/heads/main");
    REQUIRE(j["repository"] == "org/repo");
    REQUIRE(j["sender"] == "github-actions");
    REQUIRE(j["workflow_run_id"] == "");
    REQUIRE_FALSE(j["workflow_run_id"].is_null());
}

TEST_CASE("compact payload escapes non-ASCII and special characters") {
    auto n = make_notification("caf\xc3\xa9", "a\"b\\c", DEFAULT_REF, DEFAULT_REPOSITORY,
                               DEFAULT_SENDER, "");
    std::string text = serialize_compact(n);
    REQUIRE(text.find("\"hook_id\":\"caf\\u00e9\"") != std::string::npos);
    REQUIRE(text.find("\"sha\":\"a\\\"b\\\\c\"") != std::string::npos);
    REQUIRE(text.find(' ') == std::string::npos);
}

TEST_CASE("invalid UTF-8 is replaced instead of failing") {
    auto n = make_notification(std::string("x\xff"), "s", DEFAULT_REF, DEFAULT_REPOSITORY,
                               DEFAULT_SENDER, "");
    std::string text;
    REQUIRE_NOTHROW(text = serialize_compact(n));
    REQUIRE(text.find("\"hook_id\":\"x\\ufffd\"") != std::string::npos);
}

TEST_CASE("pretty payload is indented and parses to the same object") {
    auto n = make_notification("deploy-staging", "abc", DEFAULT_REF, DEFAULT_REPOSITORY,
                               DEFAULT_SENDER, "");
    std::string pretty = serialize_pretty(n);
    REQUIRE(pretty.rfind("{\n  \"hook_id\": \"deploy-staging\",", 0) == 0);
    REQUIRE(nlohmann::json::parse(pretty) == nlohmann::json::parse(serialize_compact(n)));
}
