#pragma once
#include <catch2/catch.hpp>
#include "arg_parser.hpp"
#include "cli_commands.hpp"
#include "config_utils.hpp"
#include "deploy_notification.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "signature.hpp"
#include "version.hpp"
#include "webhook_sender.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace deployhook::test_support {

/**
 * @brief Transport double that records every request and replays a canned
 * result.
 */
class FakeTransport : public HttpTransport {
  public:
    explicit FakeTransport(DeliveryResult result) : result_(std::move(result)) {}

    DeliveryResult post(const std::string& url, const std::string& body,
                        const HeaderList& headers, std::chrono::seconds timeout) override {
        ++calls;
        last_url = url;
        last_body = body;
        last_headers = headers;
        last_timeout = timeout;
        return result_;
    }

    std::string header(const std::string& name) const {
        for (const auto& [k, v] : last_headers)
            if (k == name)
                return v;
        return "";
    }

    int calls = 0;
    std::string last_url;
    std::string last_body;
    HeaderList last_headers;
    std::chrono::seconds last_timeout{0};

  private:
    DeliveryResult result_;
};

inline HttpResponse response(long status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

/** @brief What the loopback server saw. */
struct ReceivedRequest {
    std::string head;
    std::string body;
    std::atomic<int> connections{0};
    std::atomic<bool> done{false};
};

/**
 * @brief Accept connections on 127.0.0.1 and answer each with @p reply.
 *
 * The server reads one full request per connection (headers plus
 * Content-Length bytes). With @p reply empty it reads the request and then
 * holds the connection open without answering until the client hangs up.
 * Returns the bound port.
 */
inline uint16_t start_server(ReceivedRequest& rec, std::string reply, int max_connections = 1) {
    int srv = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(srv >= 0);
    int one = 1;
    setsockopt(srv, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(listen(srv, 4) == 0);
    socklen_t len = sizeof(addr);
    getsockname(srv, reinterpret_cast<sockaddr*>(&addr), &len);
    uint16_t port = ntohs(addr.sin_port);
    std::thread([srv, &rec, reply, max_connections]() {
        for (int c = 0; c < max_connections; ++c) {
            int cli = accept(srv, nullptr, nullptr);
            if (cli < 0)
                break;
            ++rec.connections;
            std::string req;
            char buf[1024];
            size_t need = std::string::npos;
            while (need == std::string::npos || req.size() < need) {
                ssize_t n = read(cli, buf, sizeof(buf));
                if (n <= 0)
                    break;
                req.append(buf, static_cast<size_t>(n));
                auto pos = req.find("\r\n\r\n");
                if (need == std::string::npos && pos != std::string::npos) {
                    size_t body_len = 0;
                    auto cl = req.find("Content-Length: ");
                    if (cl != std::string::npos && cl < pos)
                        body_len = std::stoul(req.substr(cl + 16));
                    need = pos + 4 + body_len;
                }
            }
            auto pos = req.find("\r\n\r\n");
            if (pos != std::string::npos) {
                rec.head = req.substr(0, pos);
                rec.body = req.substr(pos + 4);
            }
            if (reply.empty()) {
                while (read(cli, buf, sizeof(buf)) > 0) {
                }
            } else {
                ssize_t w = write(cli, reply.c_str(), reply.size());
                (void)w;
            }
            close(cli);
        }
        close(srv);
        rec.done = true;
    }).detach();
    return port;
}

/** @brief A loopback port with nothing listening on it. */
inline uint16_t closed_port() {
    int s = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(s, reinterpret_cast<sockaddr*>(&addr), &len);
    close(s);
    return ntohs(addr.sin_port);
}

inline void wait_for(const std::atomic<bool>& flag) {
    for (int i = 0; i < 200 && !flag; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
}

inline void remove_path(const fs::path& target) {
    std::error_code ec;
    fs::remove(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        INFO("Failed to remove '" << target.string() << "': " << ec.message());
        REQUIRE(false);
    }
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::trunc);
    ofs << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

} // namespace deployhook::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::deployhook::test_support::remove_path((path))
#endif
