#include "logger.hpp"
#include <zlib.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::mutex g_log_mtx;

static std::string local_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0)
            ok = false;
    }
    return gzclose(out) == Z_OK && ok;
}

/**
 * @brief Shift `path.N` to `path.N+1`, dropping the oldest, and move the
 * active file to `path.1` (or `path.1.gz`).
 *
 * Must be called with the log mutex held and the stream closed.
 */
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    const std::string ext = gz ? ".gz" : "";
    if (keep == 0) {
        fs::remove(g_log_path, ec);
        return;
    }
    fs::remove(g_log_path + "." + std::to_string(keep) + ext, ec);
    for (size_t i = keep - 1; i > 0; --i)
        fs::rename(g_log_path + "." + std::to_string(i) + ext,
                   g_log_path + "." + std::to_string(i + 1) + ext, ec);
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (gz && !ec) {
        if (gzip_file(first.string(), first.string() + ".gz"))
            fs::remove(first, ec);
        else
            std::cerr << "Failed to compress rotated log: " << first.string() << std::endl;
    }
}

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    g_min_level.store(level);
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    return true;
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open())
        return;
    std::string line;
    if (g_json_log.load()) {
        nlohmann::ordered_json j;
        j["timestamp"] = local_timestamp();
        j["level"] = level_label(level);
        j["msg"] = message;
        for (const auto& [k, v] : fields)
            j[k] = v;
        line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        line = "[" + local_timestamp() + "] [" + level_label(level) + "] " + message;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    g_log_ofs << line << std::endl;
    if (g_max_size.load() == 0)
        return;
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    rotate_files();
    g_log_ofs.clear();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
}
