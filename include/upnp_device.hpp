#ifndef UPNP_DEVICE_HPP
#define UPNP_DEVICE_HPP

#include <cstdint>
#include <string>

#include "http/response.hpp"

namespace upnp
{

constexpr const char* device_description_path = "/ssdp/device-desc.xml";

struct device_info
{
    std::string uuid;
    std::string friendly_name;
    std::string model_name;
    std::string manufacturer_name;
};

std::string render_device_description(const device_info& device);

/// Carries Application-URL http://{addr}:{port}/apps/ and no Content-Length
http::response device_description_response(const device_info& device, const std::string& addr, uint16_t dial_port);

} // namespace upnp

#endif
