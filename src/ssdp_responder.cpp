#include "ssdp_responder.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <socketwrapper.hpp>

#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>

#include "fmt/format.h"

namespace discovery
{

static constexpr std::string_view log_name {"SSDP-UDP-Server"};

static void set_multicast_options(int fd, const std::string& local_addr)
{
    ip_mreq membership {};
    if(inet_pton(AF_INET, SSDP_MULTICAST_IP, &membership.imr_multiaddr) != 1
        || inet_pton(AF_INET, local_addr.c_str(), &membership.imr_interface) != 1)
        throw std::runtime_error {fmt::format("Invalid interface address {}", local_addr)};

    if(setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) != 0)
        throw std::runtime_error {fmt::format("Failed to join {}: {}", SSDP_MULTICAST_IP, std::strerror(errno))};

    unsigned char ttl = 2;
    if(setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) != 0)
        logging::error(log_name, "Set socket option IP_MULTICAST_TTL error: {}", std::strerror(errno));

    unsigned char loop = 1;
    if(setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) != 0)
        logging::error(log_name, "Set socket option IP_MULTICAST_LOOP error: {}", std::strerror(errno));
}

ssdp_responder::ssdp_responder(upnp::device_info device, uint16_t dial_port, address_provider local_addr,
    unsigned int boot_id, unsigned int max_age)
    : m_device {std::move(device)},
      m_port {dial_port},
      m_local_addr {std::move(local_addr)},
      m_boot_id {boot_id},
      m_max_age {max_age}
{}

std::string ssdp_responder::location(const std::string& addr) const
{
    return fmt::format("http://{}:{}{}", addr, m_port, upnp::device_description_path);
}

std::optional<std::string> ssdp_responder::handle_datagram(std::string_view datagram) const
{
    if(datagram.compare(0, 8, "M-SEARCH") != 0 || datagram.find(dial_service_type) == std::string_view::npos)
        return std::nullopt;

    return search_response(m_local_addr());
}

std::string ssdp_responder::search_response(const std::string& addr) const
{
    // Many clients parse these headers by their literal text
    return fmt::format(
        "HTTP/1.1 200 OK\r\n"
        "LOCATION: {0}\r\n"
        "CACHE-CONTROL: max-age={1}\r\n"
        "DATE: {2}\r\n"
        "EXT: \r\n"
        "BOOTID.UPNP.ORG: {3}\r\n"
        "SERVER: Linux/2.6 UPnP/1.1 dialcast_ssdp/1.0\r\n"
        "ST: {4}\r\n"
        "USN: uuid:{5}::{4}\r\n"
        "\r\n",
        location(addr),
        m_max_age,
        utils::http_date(),
        m_boot_id,
        dial_service_type,
        m_device.uuid
    );
}

std::string ssdp_responder::alive_message(const std::string& addr) const
{
    return fmt::format(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: {0}:{1}\r\n"
        "CACHE-CONTROL: max-age={2}\r\n"
        "NT: {3}\r\n"
        "NTS: ssdp:alive\r\n"
        "LOCATION: {4}\r\n"
        "USN: uuid:{5}::{3}\r\n"
        "\r\n",
        SSDP_MULTICAST_IP,
        SSDP_PORT,
        m_max_age,
        dial_service_type,
        location(addr),
        m_device.uuid
    );
}

std::string ssdp_responder::byebye_message() const
{
    return fmt::format(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: {0}:{1}\r\n"
        "NT: {2}\r\n"
        "NTS: ssdp:byebye\r\n"
        "USN: uuid:{3}::{2}\r\n"
        "\r\n",
        SSDP_MULTICAST_IP,
        SSDP_PORT,
        dial_service_type,
        m_device.uuid
    );
}

void ssdp_responder::serve(std::atomic<bool>& run_condition)
{
    const std::string local_addr = m_local_addr();

    net::udp_socket<net::ip_version::v4> sock {"0.0.0.0", SSDP_PORT};
    set_multicast_options(sock.get(), local_addr);
    logging::info(log_name, "Listening on {}:{} for interface {}", SSDP_MULTICAST_IP, SSDP_PORT, local_addr);

    try {
        sock.send(SSDP_MULTICAST_IP, SSDP_PORT, alive_message(local_addr));
    } catch(const std::exception& e) {
        logging::error(log_name, "Error on sending the alive advertisement: {}", e.what());
    }

    while(run_condition)
    {
        pollfd pfd {sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(m_tick.count()));
        if(ready < 0)
        {
            if(errno == EINTR)
                continue;
            logging::error(log_name, "Poll on the SSDP socket failed: {}", std::strerror(errno));
            continue;
        }
        if(ready == 0 || !(pfd.revents & POLLIN))
            continue;

        try {
            auto [buffer, peer] = sock.read<char>(4096);
            std::optional<std::string> reply = handle_datagram(std::string_view {buffer.data(), buffer.size()});
            if(!reply)
                continue;

            logging::debug(log_name, "Sending reply to {}:{}", peer.addr, peer.port);
            sock.send(peer.addr, peer.port, *reply);
        } catch(const std::exception& e) {
            logging::error(log_name, "An error occurred while processing a datagram: {}", e.what());
        }
    }

    try {
        sock.send(SSDP_MULTICAST_IP, SSDP_PORT, byebye_message());
        logging::debug(log_name, "Sent byebye advertisement");
    } catch(const std::exception& e) {
        logging::error(log_name, "Error on sending the byebye advertisement: {}", e.what());
    }
}

} // namespace discovery
