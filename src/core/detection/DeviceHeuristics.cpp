#include "core/detection/DeviceHeuristics.hpp"

#include <algorithm>
#include <cctype>

namespace camlink::core {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool containsAny(const std::string& text, const std::vector<std::string>& needles,
                 std::string* matched = nullptr) {
    for (const auto& needle : needles) {
        if (text.find(needle) != std::string::npos) {
            if (matched) {
                *matched = needle;
            }
            return true;
        }
    }
    return false;
}

std::string extractTitle(const std::string& lowerBody) {
    auto open = lowerBody.find("<title");
    if (open == std::string::npos) {
        return {};
    }
    auto start = lowerBody.find('>', open);
    if (start == std::string::npos) {
        return {};
    }
    auto end = lowerBody.find("</title", start);
    if (end == std::string::npos) {
        return {};
    }
    return lowerBody.substr(start + 1, end - start - 1);
}

const std::vector<std::string>& routerTitleWords() {
    static const std::vector<std::string> words{
        "router",   "roteador", "gateway",  "modem",   "access point", "tp-link", "tplink",
        "d-link",   "dlink",    "netgear",  "linksys", "asus",         "tenda",   "mikrotik",
        "zyxel",    "mercusys", "ubiquiti", "openwrt", "luci",         "fritz!box"};
    return words;
}

const std::vector<std::string>& routerPhrases() {
    static const std::vector<std::string> phrases{
        "router configuration", "router admin",      "wireless settings", "wifi configuration",
        "network settings",     "gateway settings",  "dhcp settings",     "port forwarding",
        "firewall settings",    "printer status",    "print queue",       "toner levels",
        "ink levels",           "nas settings",      "file server"};
    return phrases;
}

const std::vector<std::string>& routerAdminPaths() {
    static const std::vector<std::string> paths{"/cgi-bin/luci", "/userrpm/", "/goform/",
                                                "/boaform/", "/webpages/login.html"};
    return paths;
}

const std::vector<std::string>& embeddedServers() {
    static const std::vector<std::string> servers{"lighttpd", "boa", "goahead", "mini_httpd",
                                                  "micro_httpd", "routeros"};
    return servers;
}

const std::vector<std::string>& adminWords() {
    static const std::vector<std::string> words{"admin", "setup", "configuration", "wizard"};
    return words;
}

const std::vector<std::string>& nonCameraManufacturers() {
    static const std::vector<std::string> vendors{
        "tp-link", "tplink",  "linksys", "netgear", "d-link", "dlink",    "belkin",
        "cisco",   "mikrotik", "zyxel",  "tenda",   "mercusys", "ubiquiti", "buffalo",
        "canon",   "epson",   "brother", "lexmark", "xerox",  "ricoh",    "kyocera",
        "roku",    "sonos",   "synology", "qnap"};
    return vendors;
}

} // namespace

std::string pageVerdictToString(PageVerdict verdict) {
    switch (verdict) {
    case PageVerdict::Camera:
        return "Camera";
    case PageVerdict::Router:
        return "Router";
    case PageVerdict::LoginOnly:
        return "LoginOnly";
    case PageVerdict::NonCamera:
        return "NonCamera";
    }
    return "NonCamera";
}

const std::vector<std::string>& DeviceHeuristics::cameraMarkers() {
    static const std::vector<std::string> markers{
        "camera", "ipcam",  "webcam",    "video", "stream", "onvif",    "hikvision",
        "dahua",  "axis",   "foscam",    "surveillance", "rtsp", "nvr", "dvr",
        "ptz",    "snapshot", "live view", "xmeye", "netsurveillance"};
    return markers;
}

int DeviceHeuristics::countCameraMarkers(const std::string& text) {
    auto lower = toLower(text);
    const auto& markers = cameraMarkers();
    return static_cast<int>(std::count_if(markers.begin(), markers.end(), [&](const std::string& m) {
        return lower.find(m) != std::string::npos;
    }));
}

bool DeviceHeuristics::isBlacklistedManufacturer(const std::string& manufacturer) {
    if (manufacturer.empty()) {
        return false;
    }
    return containsAny(toLower(manufacturer), nonCameraManufacturers());
}

bool DeviceHeuristics::matchesRouter(const std::string& lowerBody, const std::string& lowerServer,
                                     int cameraMarkers, std::string& reason) {
    std::string matched;

    auto title = extractTitle(lowerBody);
    if (!title.empty() && containsAny(title, routerTitleWords(), &matched)) {
        reason = "router title '" + matched + "'";
        return true;
    }

    if (containsAny(lowerBody, routerPhrases(), &matched)) {
        reason = "router admin phrase '" + matched + "'";
        return true;
    }

    if (containsAny(lowerBody, routerAdminPaths(), &matched)) {
        reason = "router admin path '" + matched + "'";
        return true;
    }

    if (cameraMarkers == 0 && !lowerServer.empty() &&
        containsAny(lowerServer, embeddedServers(), &matched) &&
        containsAny(lowerBody, adminWords())) {
        reason = "embedded server '" + matched + "' with admin page";
        return true;
    }

    return false;
}

bool DeviceHeuristics::isLoginForm(const std::string& lowerBody) {
    return lowerBody.find("type=\"password\"") != std::string::npos ||
           lowerBody.find("type='password'") != std::string::npos ||
           lowerBody.find("type=password") != std::string::npos ||
           lowerBody.find("login") != std::string::npos ||
           lowerBody.find("sign in") != std::string::npos;
}

PageAssessment DeviceHeuristics::assessHttpPage(const std::string& body,
                                                const std::string& serverHeader) {
    auto lowerBody = toLower(body);
    auto lowerServer = toLower(serverHeader);

    PageAssessment assessment;
    assessment.cameraMarkers = countCameraMarkers(lowerBody);

    std::string reason;
    if (matchesRouter(lowerBody, lowerServer, assessment.cameraMarkers, reason)) {
        assessment.verdict = PageVerdict::Router;
        assessment.reason = reason;
        return assessment;
    }

    if (assessment.cameraMarkers > 0) {
        assessment.verdict = PageVerdict::Camera;
        assessment.confidence = std::min(0.3 + 0.15 * assessment.cameraMarkers, 0.9);
        assessment.reason = std::to_string(assessment.cameraMarkers) + " camera marker(s)";
        return assessment;
    }

    if (isLoginForm(lowerBody)) {
        assessment.verdict = PageVerdict::LoginOnly;
        assessment.reason = "login page without camera markers";
        return assessment;
    }

    assessment.verdict = PageVerdict::NonCamera;
    assessment.reason = "no camera markers";
    return assessment;
}

} // namespace camlink::core
