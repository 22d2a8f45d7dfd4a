#include "server/http_server.h"
#include "util/log.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace skyline {

static constexpr size_t MAX_REQUEST_HEAD = 8192;

HttpServer::HttpServer(DatasetCache& cache, RouteConfig config)
    : m_cache(cache)
    , m_config(config)
{}

HttpServer::~HttpServer() {
    request_stop();
    reap_connections(true);
    if (m_listen_fd >= 0) ::close(m_listen_fd);
}

bool HttpServer::listen(int port) {
    m_listen_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (m_listen_fd < 0) {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    int yes = 1;
    setsockopt(m_listen_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(m_listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(m_listen_fd, 64) < 0) {
        LOG_ERROR("bind/listen on port %d failed: %s", port, std::strerror(errno));
        ::close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(m_listen_fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
        m_port = ntohs(addr.sin_port);
    else
        m_port = port;

    m_running.store(true);
    LOG_INFO("HTTP server listening on port %d", m_port);
    return true;
}

void HttpServer::run() {
    while (m_running.load()) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(m_listen_fd, &read_fds);

        timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 500000;  // 500 ms, to notice request_stop()

        int ready = select(m_listen_fd + 1, &read_fds, nullptr, nullptr, &timeout);
        reap_connections(false);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("select() failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0 || !FD_ISSET(m_listen_fd, &read_fds)) continue;

        sockaddr_in client{};
        socklen_t len = sizeof(client);
        int fd = accept(m_listen_fd, reinterpret_cast<sockaddr*>(&client), &len);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN)
                LOG_WARN("accept() failed: %s", std::strerror(errno));
            continue;
        }

        char ip[INET_ADDRSTRLEN] = "?";
        inet_ntop(AF_INET, &client.sin_addr, ip, sizeof(ip));
        LOG_DEBUG("Connection from %s:%d", ip, ntohs(client.sin_port));

        auto done = std::make_shared<std::atomic<bool>>(false);
        Connection conn;
        conn.done = done;
        conn.thread = std::thread([this, fd, done] {
            serve_connection(fd);
            done->store(true);
        });
        m_connections.push_back(std::move(conn));
    }

    LOG_INFO("HTTP server stopping, waiting for %zu connection(s)", m_connections.size());
    reap_connections(true);
}

void HttpServer::reap_connections(bool wait_all) {
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = m_connections.erase(it);
        } else {
            ++it;
        }
    }
}

static bool send_all(int fd, const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void HttpServer::serve_connection(int fd) {
    timeval rcv_timeout;
    rcv_timeout.tv_sec = 5;
    rcv_timeout.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &rcv_timeout, sizeof(rcv_timeout));

    /* Read until the end of the request head */
    std::string head;
    char buf[1024];
    while (head.find("\r\n\r\n") == std::string::npos && head.size() < MAX_REQUEST_HEAD) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        head.append(buf, static_cast<size_t>(n));
    }

    HttpResponse resp;
    HttpRequest req;
    if (head.find("\r\n") == std::string::npos || !parse_request(head, req)) {
        resp.set_text(400, "malformed request");
    } else {
        try {
            resp = handle_request(req, m_cache, m_config);
        } catch (const std::exception& e) {
            LOG_ERROR("Request handler failed: %s", e.what());
            resp = HttpResponse{};
            resp.set_text(500, "internal error");
        } catch (...) {
            LOG_ERROR("Request handler failed: unknown exception");
            resp = HttpResponse{};
            resp.set_text(500, "internal error");
        }
    }

    if (!send_all(fd, resp.serialize()))
        LOG_WARN("Client disconnected before response was sent: %s", std::strerror(errno));

    ::close(fd);
}

} // namespace skyline
