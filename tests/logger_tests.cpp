#include <zlib.h>
#include "test_common.hpp"
#include <nlohmann/json.hpp>

using deployhook::test_support::read_file;

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
        set_log_level(LogLevel::INFO);
    }
};

TEST_CASE("Logger is inert until initialized") {
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE_NOTHROW(log_info("nothing to see"));
}

TEST_CASE("Logger writes plain lines with fields") {
    fs::path log = fs::temp_directory_path() / "deployhook_plain.log";
    fs::remove(log);
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::INFO));
    REQUIRE(logger_initialized());
    log_info("Webhook delivered", {{"hook_id", "deploy-staging"}, {"status", "200"}});
    log_debug("hidden");
    shutdown_logger();
    std::string text = read_file(log);
    REQUIRE(text.find("[INFO] Webhook delivered hook_id=deploy-staging status=200") !=
            std::string::npos);
    REQUIRE(text.find("hidden") == std::string::npos);
    FS_REMOVE(log);
}

TEST_CASE("Logger honours level changes") {
    fs::path log = fs::temp_directory_path() / "deployhook_level.log";
    fs::remove(log);
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::DEBUG));
    log_debug("first");
    set_log_level(LogLevel::ERR);
    log_warning("second");
    log_error("third");
    shutdown_logger();
    std::string text = read_file(log);
    REQUIRE(text.find("[DEBUG] first") != std::string::npos);
    REQUIRE(text.find("second") == std::string::npos);
    REQUIRE(text.find("[ERROR] third") != std::string::npos);
    FS_REMOVE(log);
}

TEST_CASE("Logger JSON output is valid JSON per line") {
    fs::path log = fs::temp_directory_path() / "deployhook_json.log";
    fs::remove(log);
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::INFO));
    set_json_logging(true);
    log_error("Webhook transport failure", {{"error", "Couldn't connect \"x\"\n"}});
    shutdown_logger();
    std::ifstream ifs(log);
    std::string line;
    REQUIRE(std::getline(ifs, line));
    auto j = nlohmann::json::parse(line);
    REQUIRE(j["level"] == "ERROR");
    REQUIRE(j["msg"] == "Webhook transport failure");
    REQUIRE(j["error"] == "Couldn't connect \"x\"\n");
    REQUIRE(j.contains("timestamp"));
    ifs.close();
    FS_REMOVE(log);
}

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "deployhook_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    for (const auto& p : {log, log1, log2, log3})
        fs::remove(p);
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    for (int i = 0; i < 50; ++i)
        log_info("rotation line " + std::to_string(i));
    shutdown_logger();
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));
    REQUIRE(fs::file_size(log1) > 0);
    for (const auto& p : {log, log1, log2})
        FS_REMOVE(p);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "deployhook_gz.log";
    fs::path gz1 = log;
    gz1 += ".1.gz";
    fs::path plain1 = log;
    plain1 += ".1";
    fs::remove(log);
    fs::remove(gz1);
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 80, 1));
    set_log_compression(true);
    for (int i = 0; i < 5; ++i)
        log_info("compressed line " + std::to_string(i));
    shutdown_logger();
    REQUIRE(fs::exists(gz1));
    REQUIRE_FALSE(fs::exists(plain1));
    gzFile in = gzopen(gz1.string().c_str(), "rb");
    REQUIRE(in != nullptr);
    char buf[512] = {0};
    int n = gzread(in, buf, sizeof(buf) - 1);
    gzclose(in);
    REQUIRE(n > 0);
    REQUIRE(std::string(buf, static_cast<size_t>(n)).find("compressed line") !=
            std::string::npos);
    FS_REMOVE(log);
    FS_REMOVE(gz1);
}

TEST_CASE("Logger reports unopenable paths") {
    LoggerGuard guard;
    REQUIRE_FALSE(init_logger("/nonexistent-dir/deployhook.log"));
    REQUIRE_FALSE(logger_initialized());
}
