/*
 * XMLUtil.h - Simple XML utility class for parsing and generation
 * This file is part of LapCut.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef XMLUTIL_H
#define XMLUTIL_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Core {
namespace Utility {

/**
 * @brief Simple XML utility class for basic parsing and generation
 *
 * Provides lightweight XML functionality without external dependencies.
 * Sized for small documents such as MoTeC .ldx marker files: elements,
 * attributes, text content, comments and the XML declaration. DTDs and
 * CDATA sections are not supported.
 *
 * Parse failures throw std::runtime_error.
 */
class XMLUtil {
public:
    /**
     * @brief Simple XML element representation
     *
     * Attributes are kept in insertion order so that generated documents
     * list them the way the caller added them.
     */
    struct Element {
        std::string name;
        std::string content;
        std::vector<std::pair<std::string, std::string>> attributes;
        std::vector<Element> children;

        Element() = default;
        Element(const std::string& elementName) : name(elementName) {}
        Element(const std::string& elementName, const std::string& elementContent)
            : name(elementName), content(elementContent) {}

        /**
         * @brief Get an attribute value
         * @return Pointer to the value, or nullptr if the attribute is absent
         */
        const std::string* attribute(const std::string& key) const;

        /**
         * @brief Set an attribute, replacing an existing value in place
         */
        Element& setAttribute(const std::string& key, const std::string& value);

        /**
         * @brief Append a child and return a reference to it
         */
        Element& addChild(Element child);
    };

    /**
     * @brief Parse XML string into element tree
     * @param xml The XML string to parse
     * @return Root element of the parsed XML
     */
    static Element parseXML(const std::string& xml);

    /**
     * @brief Generate XML string from element tree
     * @param element The root element to serialize
     * @param indent Current indentation level (for pretty printing)
     * @return XML string representation
     */
    static std::string generateXML(const Element& element, int indent = 0);

    /**
     * @brief Generate a complete document with an XML declaration
     */
    static std::string generateDocument(const Element& root);

    /**
     * @brief Find all elements with given name at any depth below parent
     * @return Matches in document order
     */
    static std::vector<const Element*> findDescendants(const Element& parent, const std::string& name);

    /**
     * @brief Escape XML special characters in text content
     * @param text The text to escape
     * @return Escaped text safe for XML content
     */
    static std::string escapeXML(const std::string& text);

    /**
     * @brief Unescape XML entities in text content
     * @param text The text to unescape
     * @return Unescaped text with entities converted back to characters
     */
    static std::string unescapeXML(const std::string& text);

private:
    /**
     * @brief Parse a single XML element from string
     * @param xml The XML string
     * @param pos Current position in string (modified during parsing)
     * @return Parsed element
     */
    static Element parseElement(const std::string& xml, size_t& pos);

    /**
     * @brief Skip whitespace, comments and processing instructions
     */
    static void skipMisc(const std::string& xml, size_t& pos);

    /**
     * @brief Skip whitespace characters
     * @param xml The XML string
     * @param pos Current position in string (modified)
     */
    static void skipWhitespace(const std::string& xml, size_t& pos);

    /**
     * @brief Parse element attributes
     * @param attributeString The attribute string to parse
     * @return Attribute name/value pairs in document order
     */
    static std::vector<std::pair<std::string, std::string>> parseAttributes(const std::string& attributeString);

    /**
     * @brief Generate indentation string
     * @param level The indentation level
     * @return String with appropriate indentation
     */
    static std::string getIndent(int level);

    static void writeElement(std::ostream& out, const Element& element, int level);

    static void collectDescendants(const Element& parent, const std::string& name,
                                   std::vector<const Element*>& out);
};

} // namespace Utility
} // namespace Core
} // namespace LapCut

#endif // XMLUTIL_H
