/*
 * XMLUtil.cpp - Simple XML utility class implementation
 * This file is part of LapCut.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Core {
namespace Utility {

const std::string* XMLUtil::Element::attribute(const std::string& key) const {
    for (const auto& attr : attributes) {
        if (attr.first == key) {
            return &attr.second;
        }
    }
    return nullptr;
}

XMLUtil::Element& XMLUtil::Element::setAttribute(const std::string& key, const std::string& value) {
    for (auto& attr : attributes) {
        if (attr.first == key) {
            attr.second = value;
            return *this;
        }
    }
    attributes.emplace_back(key, value);
    return *this;
}

XMLUtil::Element& XMLUtil::Element::addChild(Element child) {
    children.push_back(std::move(child));
    return children.back();
}

XMLUtil::Element XMLUtil::parseXML(const std::string& xml) {
    size_t pos = 0;
    // UTF-8 byte order mark
    if (xml.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        pos = 3;
    }
    // Skips the XML declaration, comments and leading whitespace
    skipMisc(xml, pos);

    Element root = parseElement(xml, pos);

    skipMisc(xml, pos);
    if (pos < xml.length()) {
        throw std::runtime_error("Unexpected content after root element at position " + std::to_string(pos));
    }
    return root;
}

std::string XMLUtil::generateXML(const Element& element, int indent) {
    std::ostringstream out;
    writeElement(out, element, indent);
    return out.str();
}

void XMLUtil::writeElement(std::ostream& out, const Element& element, int level) {
    const std::string pad = getIndent(level);
    out << pad << '<' << element.name;
    for (const auto& attr : element.attributes) {
        out << ' ' << attr.first << "=\"" << escapeXML(attr.second) << '"';
    }

    bool leaf = element.children.empty();
    if (leaf && element.content.empty()) {
        out << "/>";
        return;
    }

    out << '>' << escapeXML(element.content);
    if (!leaf) {
        out << '\n';
        for (const auto& child : element.children) {
            writeElement(out, child, level + 1);
            out << '\n';
        }
        out << pad;
    }
    out << "</" << element.name << '>';
}

std::string XMLUtil::generateDocument(const Element& root) {
    return "<?xml version=\"1.0\"?>\n" + generateXML(root, 0) + "\n";
}

std::vector<const XMLUtil::Element*> XMLUtil::findDescendants(const Element& parent, const std::string& name) {
    std::vector<const Element*> result;
    collectDescendants(parent, name, result);
    return result;
}

void XMLUtil::collectDescendants(const Element& parent, const std::string& name,
                                 std::vector<const Element*>& out) {
    for (const auto& child : parent.children) {
        if (child.name == name) {
            out.push_back(&child);
        }
        collectDescendants(child, name, out);
    }
}

std::string XMLUtil::escapeXML(const std::string& text) {
    std::string result;
    result.reserve(text.length());

    for (char c : text) {
        const char* entity = nullptr;
        if (c == '<') entity = "&lt;";
        else if (c == '>') entity = "&gt;";
        else if (c == '&') entity = "&amp;";
        else if (c == '"') entity = "&quot;";
        else if (c == '\'') entity = "&apos;";

        if (entity) {
            result += entity;
        } else {
            result.push_back(c);
        }
    }
    return result;
}

std::string XMLUtil::unescapeXML(const std::string& text) {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}, {"&amp;", '&'}
    };

    // Single left-to-right pass so "&amp;lt;" decodes to "&lt;" and not "<"
    std::string result;
    result.reserve(text.length());
    size_t pos = 0;
    while (pos < text.length()) {
        if (text[pos] == '&') {
            bool matched = false;
            for (const auto& entity : entities) {
                size_t len = std::strlen(entity.first);
                if (text.compare(pos, len, entity.first) == 0) {
                    result += entity.second;
                    pos += len;
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
        }
        result += text[pos++];
    }
    return result;
}

XMLUtil::Element XMLUtil::parseElement(const std::string& xml, size_t& pos) {
    skipWhitespace(xml, pos);

    if (pos >= xml.length() || xml[pos] != '<') {
        throw std::runtime_error("Expected '<' at position " + std::to_string(pos));
    }

    size_t tagStart = pos;
    pos++; // Skip '<'

    // Find end of opening tag, ignoring '>' inside quoted attribute values
    size_t tagEnd = pos;
    char quote = 0;
    while (tagEnd < xml.length()) {
        char c = xml[tagEnd];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            break;
        }
        tagEnd++;
    }
    if (tagEnd >= xml.length()) {
        throw std::runtime_error("Unclosed tag starting at position " + std::to_string(tagStart));
    }

    std::string tagContent = xml.substr(pos, tagEnd - pos);
    pos = tagEnd + 1;

    // Check for self-closing tag
    bool selfClosing = false;
    if (!tagContent.empty() && tagContent.back() == '/') {
        selfClosing = true;
        tagContent.pop_back();
    }

    size_t nameEnd = 0;
    while (nameEnd < tagContent.length() && !std::isspace(static_cast<unsigned char>(tagContent[nameEnd]))) {
        nameEnd++;
    }
    std::string tagName = tagContent.substr(0, nameEnd);
    if (tagName.empty()) {
        throw std::runtime_error("Empty tag name at position " + std::to_string(tagStart));
    }

    Element element(tagName);
    if (nameEnd < tagContent.length()) {
        element.attributes = parseAttributes(tagContent.substr(nameEnd));
    }

    if (selfClosing) {
        return element;
    }

    // Content and children until the matching closing tag
    while (true) {
        skipWhitespace(xml, pos);
        if (pos >= xml.length()) {
            throw std::runtime_error("Missing closing tag for: " + tagName);
        }

        if (xml.compare(pos, 4, "<!--") == 0 || xml.compare(pos, 2, "<?") == 0) {
            skipMisc(xml, pos);
            continue;
        }

        if (xml.compare(pos, 2, "</") == 0) {
            size_t closeEnd = xml.find('>', pos);
            if (closeEnd == std::string::npos) {
                throw std::runtime_error("Missing closing tag for: " + tagName);
            }
            std::string closingName = xml.substr(pos + 2, closeEnd - pos - 2);
            size_t trim = closingName.find_last_not_of(" \t\r\n");
            closingName = (trim == std::string::npos) ? std::string() : closingName.substr(0, trim + 1);
            if (closingName != tagName) {
                throw std::runtime_error("Missing closing tag for: " + tagName +
                                         " (found </" + closingName + ">)");
            }
            pos = closeEnd + 1;
            return element;
        }

        if (xml[pos] == '<') {
            element.children.push_back(parseElement(xml, pos));
        } else {
            size_t textEnd = xml.find('<', pos);
            if (textEnd == std::string::npos) {
                throw std::runtime_error("Missing closing tag for: " + tagName);
            }

            std::string text = xml.substr(pos, textEnd - pos);
            size_t end = text.find_last_not_of(" \t\r\n");
            if (end != std::string::npos) {
                element.content += unescapeXML(text.substr(0, end + 1));
            }
            pos = textEnd;
        }
    }
}

void XMLUtil::skipMisc(const std::string& xml, size_t& pos) {
    while (true) {
        skipWhitespace(xml, pos);
        if (xml.compare(pos, 2, "<?") == 0) {
            size_t end = xml.find("?>", pos);
            if (end == std::string::npos) {
                throw std::runtime_error("Unterminated processing instruction at position " + std::to_string(pos));
            }
            pos = end + 2;
        } else if (xml.compare(pos, 4, "<!--") == 0) {
            size_t end = xml.find("-->", pos + 4);
            if (end == std::string::npos) {
                throw std::runtime_error("Unterminated comment at position " + std::to_string(pos));
            }
            pos = end + 3;
        } else {
            return;
        }
    }
}

void XMLUtil::skipWhitespace(const std::string& xml, size_t& pos) {
    while (pos < xml.length() && std::isspace(static_cast<unsigned char>(xml[pos]))) {
        pos++;
    }
}

std::vector<std::pair<std::string, std::string>> XMLUtil::parseAttributes(const std::string& attributeString) {
    std::vector<std::pair<std::string, std::string>> attributes;
    size_t pos = 0;

    while (pos < attributeString.length()) {
        // Skip whitespace
        while (pos < attributeString.length() && std::isspace(static_cast<unsigned char>(attributeString[pos]))) {
            pos++;
        }

        if (pos >= attributeString.length()) break;

        // Find attribute name
        size_t nameStart = pos;
        while (pos < attributeString.length() && attributeString[pos] != '=' &&
               !std::isspace(static_cast<unsigned char>(attributeString[pos]))) {
            pos++;
        }

        std::string name = attributeString.substr(nameStart, pos - nameStart);

        // Skip whitespace and '='
        while (pos < attributeString.length() &&
               (std::isspace(static_cast<unsigned char>(attributeString[pos])) || attributeString[pos] == '=')) {
            pos++;
        }

        if (pos >= attributeString.length()) {
            throw std::runtime_error("Attribute without value: " + name);
        }

        std::string value;
        if (attributeString[pos] == '"' || attributeString[pos] == '\'') {
            char quote = attributeString[pos];
            pos++; // Skip opening quote

            size_t valueStart = pos;
            while (pos < attributeString.length() && attributeString[pos] != quote) {
                pos++;
            }

            if (pos >= attributeString.length()) {
                throw std::runtime_error("Unterminated value for attribute: " + name);
            }
            value = unescapeXML(attributeString.substr(valueStart, pos - valueStart));
            pos++; // Skip closing quote
        } else {
            // Unquoted value (not recommended, but handle it)
            size_t valueStart = pos;
            while (pos < attributeString.length() && !std::isspace(static_cast<unsigned char>(attributeString[pos]))) {
                pos++;
            }
            value = unescapeXML(attributeString.substr(valueStart, pos - valueStart));
        }

        attributes.emplace_back(name, value);
    }

    return attributes;
}

std::string XMLUtil::getIndent(int level) {
    return std::string(level * 2, ' '); // 2 spaces per level
}

} // namespace Utility
} // namespace Core
} // namespace LapCut
