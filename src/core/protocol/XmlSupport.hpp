#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinyxml2 {
class XMLElement;
}

namespace camlink::core::xml {

/**
 * @brief Returns the local part of a possibly prefixed element name ("s:Body" -> "Body").
 */
std::string_view localName(const char* name);

/**
 * @brief Depth-first search for the first element with the given local name.
 * @param root Subtree to search (may be null).
 */
tinyxml2::XMLElement* findElement(tinyxml2::XMLElement* root, std::string_view name);

/**
 * @brief Trimmed text of the first element with the given local name.
 * @param document XML document text.
 * @param name Local element name (namespace prefixes are ignored).
 * @return Text, or nullopt if the document does not parse or has no such element.
 */
std::optional<std::string> firstText(const std::string& document, std::string_view name);

/**
 * @brief Trimmed text of the first element named child inside the first element named parent.
 */
std::optional<std::string> nestedText(const std::string& document, std::string_view parent,
                                      std::string_view child);

/**
 * @brief Value of an attribute on the first element with the given local name.
 */
std::optional<std::string> firstAttribute(const std::string& document, std::string_view name,
                                          const char* attribute);

/**
 * @brief Checks that a document parses and contains the given element.
 */
bool containsElement(const std::string& document, std::string_view name);

/**
 * @brief Escapes &, <, >, " and ' for use in element text.
 */
std::string escape(const std::string& text);

} // namespace camlink::core::xml
