#ifndef SSDP_RESPONDER_HPP
#define SSDP_RESPONDER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "upnp_device.hpp"

namespace discovery
{

#define SSDP_MULTICAST_IP "239.255.255.250"
#define SSDP_PORT 1900

constexpr std::string_view dial_service_type {"urn:dial-multiscreen-org:service:dial:1"};

// LOCATION of every message points at the device description of the DIAL server
class ssdp_responder
{
public:
    using address_provider = std::function<std::string()>;

    ssdp_responder() = delete;
    ssdp_responder(const ssdp_responder&) = delete;
    ssdp_responder& operator=(const ssdp_responder&) = delete;
    ssdp_responder(ssdp_responder&&) = delete;
    ssdp_responder& operator=(ssdp_responder&&) = delete;
    ~ssdp_responder() = default;

    ssdp_responder(upnp::device_info device, uint16_t dial_port, address_provider local_addr,
        unsigned int boot_id = 1, unsigned int max_age = 1800);

    /// Reply to a datagram, std::nullopt for anything but a DIAL M-SEARCH
    std::optional<std::string> handle_datagram(std::string_view datagram) const;

    std::string search_response(const std::string& addr) const;

    std::string alive_message(const std::string& addr) const;

    std::string byebye_message() const;

    /**
     * Bind the SSDP port, join the multicast group and answer searches
     * until run_condition turns false. Throws std::runtime_error if the
     * socket can not be set up; errors on single datagrams are logged.
     */
    void serve(std::atomic<bool>& run_condition);

    void set_tick(std::chrono::milliseconds tick)
    {
        m_tick = tick;
    }

private:

    std::string location(const std::string& addr) const;

    const upnp::device_info m_device;

    const uint16_t m_port;

    address_provider m_local_addr;

    const unsigned int m_boot_id;

    const unsigned int m_max_age;

    std::chrono::milliseconds m_tick {250};

};

} // namespace discovery

#endif
