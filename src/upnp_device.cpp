#include "upnp_device.hpp"
#include "utils.hpp"

#include "fmt/format.h"

namespace upnp
{

std::string render_device_description(const device_info& device)
{
    std::string xml = fmt::format(
        "<?xml version=\"1.0\"?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\" xmlns:r=\"urn:restful-tv-org:schemas:upnp-dd\">\n"
        "  <specVersion>\n"
        "  <major>1</major>\n"
        "  <minor>0</minor>\n"
        "  </specVersion>\n"
        "  <device>\n"
        "    <deviceType>urn:schemas-upnp-org:device:tvdevice:1</deviceType>\n"
        "    <friendlyName>{0}</friendlyName>\n"
        "    <manufacturer>{1}</manufacturer>\n"
        "    <modelName>{2}</modelName>\n"
        "    <UDN>uuid:{3}</UDN>\n"
        "  </device>\n"
        "</root>\n",
        utils::xml_escape(device.friendly_name),
        utils::xml_escape(device.manufacturer_name),
        utils::xml_escape(device.model_name),
        utils::xml_escape(device.uuid)
    );

    return utils::crlf(xml);
}

http::response device_description_response(const device_info& device, const std::string& addr, uint16_t dial_port)
{
    http::response res {200};
    res.set_header("Content-Type", "text/xml");
    res.set_header("Application-URL", fmt::format("http://{}:{}/apps/", addr, dial_port));
    res.set_streamed_body(render_device_description(device));
    return res;
}

} // namespace upnp
