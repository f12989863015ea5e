#include "http/webserver.hpp"
#include "log.hpp"

#include <array>
#include <cerrno>
#include <exception>
#include <stdexcept>
#include <string_view>

#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace http
{

static constexpr std::string_view log_name {"DIAL-Server"};

static bool wait_readable(int fd, std::chrono::milliseconds timeout)
{
    pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if(ret < 0 && errno != EINTR)
        throw std::runtime_error {"poll failed"};

    return ret > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

static std::string peer_address(int fd)
{
    sockaddr_in peer {};
    socklen_t len = sizeof(peer);
    if(::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &len) != 0)
        return "";

    std::array<char, INET_ADDRSTRLEN> addr;
    if(::inet_ntop(AF_INET, &peer.sin_addr, addr.data(), addr.size()) == nullptr)
        return "";

    return addr.data();
}

webserver::webserver(uint16_t port, handler req_handler)
    : m_acceptor {"0.0.0.0", port},
      m_handler {std::move(req_handler)}
{}

webserver::~webserver()
{
    reap_workers(true);
}

void webserver::handle_connection(net::tcp_connection<net::ip_version::v4>&& conn) const
{
    const std::string peer = peer_address(conn.get());

    std::string raw;
    std::array<char, 4096> buffer;
    while(raw.size() < max_request_size)
    {
        auto expected = request::expected_size(raw);
        if(expected && raw.size() >= *expected)
            break;

        if(!wait_readable(conn.get(), m_read_timeout))
            break;

        size_t br = conn.read(net::span {buffer.data(), buffer.size()});
        if(br == 0)
            break;
        raw.append(buffer.data(), br);
    }

    response res;
    request req;
    try {
        req.parse(raw);
    } catch(const std::invalid_argument& ia) {
        logging::debug(log_name, "Rejected unparsable request from {}: {}", peer, ia.what());
        res.set_code(400);
        res.set_header("Connection", "close");
        conn.send(net::span {res.to_string()});
        return;
    }

    logging::debug(log_name, "Received {} request {} from {}", req.get_method(), req.get_resource(), peer);

    try {
        res = m_handler(req, peer);
    } catch(const std::exception& e) {
        logging::error(log_name, "Request handler raised an exception: {}", e.what());
        res = response {500};
    }

    res.set_header("Connection", "close");
    std::string res_str = res.to_string();
    logging::debug(log_name, "Send response:\n{}", res_str);
    conn.send(net::span {res_str});
}

void webserver::reap_workers(bool wait_all)
{
    for(auto it = m_workers.begin(); it != m_workers.end(); )
    {
        if(wait_all || it->wait_for(std::chrono::seconds {0}) == std::future_status::ready)
        {
            try {
                it->get();
            } catch(const std::exception& e) {
                logging::error(log_name, "Connection worker failed: {}", e.what());
            }
            it = m_workers.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void webserver::serve(std::atomic<bool>& run_condition)
{
    logging::info(log_name, "Webserver serving ...");
    while(run_condition.load())
    {
        try {
            if(!wait_readable(m_acceptor.get(), m_tick))
            {
                reap_workers(false);
                continue;
            }

            auto conn = m_acceptor.accept();
            m_workers.push_back(std::async(std::launch::async, [this, conn = std::move(conn)]() mutable {
                handle_connection(std::move(conn));
            }));
        } catch(const std::runtime_error& e) {
            logging::error(log_name, "Accepting a connection failed: {}", e.what());
        }

        reap_workers(false);
    }

    reap_workers(true);
    logging::info(log_name, "Webserver closing");
}

} // namespace http
