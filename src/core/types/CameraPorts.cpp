#include "core/types/CameraPorts.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace camlink::core {

const std::vector<uint16_t>& CameraPorts::priorityPorts() {
    static const std::vector<uint16_t> ports{554, 8554, 80, 8080, 8000, 8899, 34567, 37777};
    return ports;
}

const std::vector<uint16_t>& CameraPorts::httpPorts() {
    static const std::vector<uint16_t> ports{80,   81,   82,   83,   88,   8000, 8008, 8080,
                                             8081, 8082, 8083, 8084, 8085, 8086, 8087, 8088,
                                             8089, 8090, 8888, 8899, 9000};
    return ports;
}

const std::vector<uint16_t>& CameraPorts::rtspPorts() {
    static const std::vector<uint16_t> ports{554, 8554, 1935, 7001, 5554};
    return ports;
}

const std::vector<uint16_t>& CameraPorts::onvifPorts() {
    static const std::vector<uint16_t> ports{80, 8080, 8000, 8899, 2020};
    return ports;
}

const std::map<std::string, std::vector<uint16_t>>& CameraPorts::vendorPorts() {
    static const std::map<std::string, std::vector<uint16_t>> ports{
        {"hikvision", {8000, 554, 80, 8080}},
        {"dahua", {37777, 554, 80, 8080}},
        {"axis", {554, 80, 8080, 8000}},
        {"foscam", {88, 554, 8080}},
        {"tp-link", {554, 2020, 8080, 9000}},
        {"xiaomi", {554, 8080, 8000}},
        {"reolink", {554, 9000, 8000}},
        {"amcrest", {554, 37777, 8080}},
        {"xiongmai", {34567, 8899, 554, 80}},
        {"generic", {554, 8080, 8899, 34567, 37777, 9000, 6036}},
    };
    return ports;
}

std::vector<uint16_t> CameraPorts::portsForManufacturer(const std::string& manufacturer) {
    std::string key = manufacturer;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = vendorPorts();
    auto it = table.find(key);
    if (it == table.end()) {
        return table.at("generic");
    }
    return it->second;
}

std::vector<uint16_t> CameraPorts::fullCatalog(const std::vector<uint16_t>& extraPorts) {
    std::vector<uint16_t> catalog = priorityPorts();
    std::set<uint16_t> seen(catalog.begin(), catalog.end());

    std::set<uint16_t> rest;
    auto collect = [&](const std::vector<uint16_t>& ports) {
        for (uint16_t port : ports) {
            if (port != 0 && !seen.contains(port)) {
                rest.insert(port);
            }
        }
    };

    collect(httpPorts());
    collect(rtspPorts());
    collect(onvifPorts());
    for (const auto& [vendor, ports] : vendorPorts()) {
        collect(ports);
    }
    collect(extraPorts);

    catalog.insert(catalog.end(), rest.begin(), rest.end());
    return catalog;
}

const std::vector<std::string>& CameraPorts::streamPaths() {
    static const std::vector<std::string> paths{
        // hikvision, dahua, amcrest
        "/cam/realmonitor?channel=1&subtype=1",
        "/cam/realmonitor?channel=1&subtype=0",
        "/Streaming/Channels/102",
        "/Streaming/Channels/101",
        // axis
        "/axis-media/media.amp",
        "/axis-media/media.amp?streamprofile=Mobile",
        "/axis-media/media.amp?streamprofile=Quality",
        // foscam
        "/videoSub",
        "/videoMain",
        "/video.cgi",
        // onvif reference firmwares
        "/onvif/media_service/stream_1",
        "/onvif1",
        // tp-link
        "/stream2",
        "/stream1",
        "/stream/1",
        // d-link
        "/video.cgi?resolution=CIF",
        "/video.cgi?resolution=VGA",
        "/video1.mjpeg",
        // vivotek
        "/live.sdp",
        // reolink
        "/h264Preview_01_sub",
        "/h264Preview_01_main",
        // generic
        "/live",
        "/stream",
        "/media",
        "/video",
        "/mjpeg",
        "/h264",
        "/rtsp",
        "/",
    };
    return paths;
}

bool CameraPorts::isStreamingPort(uint16_t port) {
    const auto& ports = rtspPorts();
    return std::find(ports.begin(), ports.end(), port) != ports.end();
}

bool CameraPorts::isWebInterfacePort(uint16_t port) {
    const auto& ports = httpPorts();
    return std::find(ports.begin(), ports.end(), port) != ports.end();
}

} // namespace camlink::core
