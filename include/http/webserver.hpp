#ifndef HTTP_WEBSERVER_HPP
#define HTTP_WEBSERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <vector>

#include "socketwrapper.hpp"

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

/// Largest request (head and body) a worker reads from one connection
constexpr size_t max_request_size = 16 * 1024;

class webserver
{
public:
    using handler = std::function<response(const request&, const std::string& peer_addr)>;

    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = delete;
    webserver& operator=(webserver&&) = delete;
    ~webserver();

    webserver(uint16_t port, handler req_handler);

    /**
     * Accept connections until run_condition turns false. The accept poll
     * wakes up every tick so a shutdown is observed within one tick. Every
     * connection is served by its own worker; serve() returns after all
     * workers finished.
     */
    void serve(std::atomic<bool>& run_condition);

    void set_tick(std::chrono::milliseconds tick)
    {
        m_tick = tick;
    }

private:

    void handle_connection(net::tcp_connection<net::ip_version::v4>&& conn) const;

    void reap_workers(bool wait_all);

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    handler m_handler;

    std::vector<std::future<void>> m_workers;

    std::chrono::milliseconds m_tick {250};

    std::chrono::milliseconds m_read_timeout {2000};

};

} // namespace http

#endif
