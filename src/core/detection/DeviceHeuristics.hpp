/**
 * @file DeviceHeuristics.hpp
 * @brief Content heuristics that tell camera web interfaces from routers and other devices.
 */

#pragma once

#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief What an HTTP page looks like.
 */
enum class PageVerdict : int {
    Camera = 0,    ///< Page carries camera or video markers
    Router = 1,    ///< Router, gateway or access point admin page
    LoginOnly = 2, ///< Login form without any camera marker
    NonCamera = 3  ///< Neither camera markers nor a login form
};

std::string pageVerdictToString(PageVerdict verdict);

/**
 * @brief Result of assessing an HTTP page.
 */
struct PageAssessment {
    PageVerdict verdict{PageVerdict::NonCamera};
    int cameraMarkers{0}; ///< Number of distinct camera markers found
    double confidence{0.0};
    std::string reason;   ///< Which rule decided the verdict
};

/**
 * @brief Stateless device classification rules.
 */
class DeviceHeuristics {
public:
    /**
     * @brief Classifies an HTTP response.
     *
     * Router rules win over camera markers. Router rules are: router vendor
     * or device words in the title, router admin phrases, router admin URL
     * paths, or an embedded-server header combined with admin words on a
     * page without camera markers.
     *
     * @param body Response body.
     * @param serverHeader Value of the Server header (may be empty).
     * @return Verdict with confidence (scaled by marker count for Camera).
     */
    static PageAssessment assessHttpPage(const std::string& body, const std::string& serverHeader);

    /**
     * @brief Counts distinct camera markers in a text.
     * @param text Text to scan (case-insensitive).
     */
    static int countCameraMarkers(const std::string& text);

    /**
     * @brief Checks a manufacturer name against the non-camera vendor list.
     * @param manufacturer Vendor string reported by the device.
     */
    static bool isBlacklistedManufacturer(const std::string& manufacturer);

    static const std::vector<std::string>& cameraMarkers();

private:
    static bool matchesRouter(const std::string& lowerBody, const std::string& lowerServer,
                              int cameraMarkers, std::string& reason);
    static bool isLoginForm(const std::string& lowerBody);
};

} // namespace camlink::core
