#include <catch2/catch_test_macros.hpp>

#include "core/protocol/XmlSupport.hpp"

using namespace camlink::core;

namespace {

const std::string DOCUMENT =
    R"(<s:Envelope xmlns:s="http://www.w3.org/2003/05/soap-envelope" )"
    R"(xmlns:trt="http://www.onvif.org/ver10/media/wsdl" xmlns:tt="http://www.onvif.org/ver10/schema">)"
    R"(<s:Body><trt:GetProfilesResponse>)"
    R"(<trt:Profiles token="Profile_1"><tt:Name>main</tt:Name></trt:Profiles>)"
    R"(<trt:Profiles token="Profile_2"><tt:Name>sub</tt:Name></trt:Profiles>)"
    R"(</trt:GetProfilesResponse></s:Body></s:Envelope>)";

} // namespace

TEST_CASE("xml::localName strips prefixes", "[XmlSupport]") {
    REQUIRE(xml::localName("tt:Name") == "Name");
    REQUIRE(xml::localName("Name") == "Name");
}

TEST_CASE("xml queries ignore namespace prefixes", "[XmlSupport]") {
    SECTION("firstText returns the first match") {
        REQUIRE(xml::firstText(DOCUMENT, "Name") == "main");
    }

    SECTION("nestedText searches below a parent") {
        REQUIRE(xml::nestedText(DOCUMENT, "Profiles", "Name") == "main");
        REQUIRE_FALSE(xml::nestedText(DOCUMENT, "Body", "Missing"));
    }

    SECTION("firstAttribute reads attributes") {
        REQUIRE(xml::firstAttribute(DOCUMENT, "Profiles", "token") == "Profile_1");
        REQUIRE_FALSE(xml::firstAttribute(DOCUMENT, "Profiles", "fixed"));
    }

    SECTION("containsElement") {
        REQUIRE(xml::containsElement(DOCUMENT, "Envelope"));
        REQUIRE(xml::containsElement(DOCUMENT, "GetProfilesResponse"));
        REQUIRE_FALSE(xml::containsElement(DOCUMENT, "Fault"));
    }

    SECTION("Malformed documents yield nothing") {
        REQUIRE_FALSE(xml::firstText("<a><b>unclosed", "b"));
        REQUIRE_FALSE(xml::containsElement("not xml at all", "Envelope"));
        REQUIRE_FALSE(xml::firstText("", "a"));
    }
}

TEST_CASE("xml::escape", "[XmlSupport]") {
    REQUIRE(xml::escape("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;");
    REQUIRE(xml::escape("plain") == "plain");
}
