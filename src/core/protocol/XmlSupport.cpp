#include "core/protocol/XmlSupport.hpp"

#include <tinyxml2.h>

namespace camlink::core::xml {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

tinyxml2::XMLElement* parse(tinyxml2::XMLDocument& doc, const std::string& document) {
    if (doc.Parse(document.data(), document.size()) != tinyxml2::XML_SUCCESS) {
        return nullptr;
    }
    return doc.RootElement();
}

} // namespace

std::string_view localName(const char* name) {
    std::string_view view(name ? name : "");
    auto colon = view.find(':');
    return colon == std::string_view::npos ? view : view.substr(colon + 1);
}

tinyxml2::XMLElement* findElement(tinyxml2::XMLElement* root, std::string_view name) {
    if (!root) {
        return nullptr;
    }
    if (localName(root->Name()) == name) {
        return root;
    }
    for (auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (auto* found = findElement(child, name)) {
            return found;
        }
    }
    return nullptr;
}

std::optional<std::string> firstText(const std::string& document, std::string_view name) {
    tinyxml2::XMLDocument doc;
    auto* element = findElement(parse(doc, document), name);
    if (!element) {
        return std::nullopt;
    }
    const char* text = element->GetText();
    return trim(text ? text : "");
}

std::optional<std::string> nestedText(const std::string& document, std::string_view parent,
                                      std::string_view child) {
    tinyxml2::XMLDocument doc;
    auto* outer = findElement(parse(doc, document), parent);
    if (!outer) {
        return std::nullopt;
    }
    for (auto* c = outer->FirstChildElement(); c; c = c->NextSiblingElement()) {
        if (auto* element = findElement(c, child)) {
            const char* text = element->GetText();
            return trim(text ? text : "");
        }
    }
    return std::nullopt;
}

std::optional<std::string> firstAttribute(const std::string& document, std::string_view name,
                                          const char* attribute) {
    tinyxml2::XMLDocument doc;
    auto* element = findElement(parse(doc, document), name);
    if (!element) {
        return std::nullopt;
    }
    const char* value = element->Attribute(attribute);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

bool containsElement(const std::string& document, std::string_view name) {
    tinyxml2::XMLDocument doc;
    return findElement(parse(doc, document), name) != nullptr;
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

} // namespace camlink::core::xml
