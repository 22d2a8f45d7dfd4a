#pragma once
#include "server/http.h"
#include <atomic>
#include <list>
#include <memory>
#include <thread>

namespace skyline {

/* Blocking HTTP/1.1 listener. One thread per connection, one request per
   connection. All connections share the same DatasetCache, so concurrent
   requests during a cold start join a single build. */
class HttpServer {
public:
    HttpServer(DatasetCache& cache, RouteConfig config);
    ~HttpServer();

    /* Bind and listen on port (0 picks a free port). Returns false on
       failure. */
    bool listen(int port);

    /* Accept loop; returns after request_stop() */
    void run();

    /* Safe to call from a signal handler */
    void request_stop() { m_running.store(false); }

    /* Actual bound port, valid after listen() */
    int port() const { return m_port; }

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

private:
    DatasetCache& m_cache;
    RouteConfig m_config;
    int m_listen_fd = -1;
    int m_port = 0;
    std::atomic<bool> m_running{false};

    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::list<Connection> m_connections;

    void serve_connection(int fd);
    void reap_connections(bool wait_all);
};

} // namespace skyline
