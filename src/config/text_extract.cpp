#include "iochannel/config/text_extract.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace ioc::text {

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::optional<std::string> attr(const std::string& xml, const std::string& key) {
    const auto pattern = "\\b" + key + "\\s*=\\s*\"([^\"]*)\"";
    std::regex re(pattern, std::regex_constants::icase);
    std::smatch match;
    if (!std::regex_search(xml, match, re) || match.size() < 2) {
        return std::nullopt;
    }
    return match[1].str();
}

std::vector<std::string> extractTags(const std::string& xml, const std::string& tagName) {
    const auto pattern = "<\\s*" + tagName + "\\b[^>]*>";
    std::regex re(pattern, std::regex_constants::icase);
    std::vector<std::string> tags;

    for (std::sregex_iterator it(xml.begin(), xml.end(), re), end; it != end; ++it) {
        tags.push_back(it->str());
    }
    return tags;
}

std::vector<std::string> extractJsonObjects(const std::string& json) {
    std::regex re("\\{[^\\{\\}]*\\}");
    std::vector<std::string> objects;
    for (std::sregex_iterator it(json.begin(), json.end(), re), end; it != end; ++it) {
        objects.push_back(it->str());
    }
    return objects;
}

std::optional<std::string> jsonValue(const std::string& object, const std::string& key) {
    std::regex re("\"" + key + "\"\\s*:\\s*(?:\"([^\"]*)\"|([A-Za-z0-9_.+\\-]+))");
    std::smatch match;
    if (!std::regex_search(object, match, re)) {
        return std::nullopt;
    }
    return match[1].matched ? match[1].str() : match[2].str();
}

std::int64_t parseInteger(const std::string& value) {
    std::size_t consumed = 0;
    const auto parsed = std::stoll(value, &consumed, 0);
    if (consumed != value.size()) {
        throw std::invalid_argument("invalid numeric value '" + value + "'");
    }
    return static_cast<std::int64_t>(parsed);
}

bool parseBool(const std::string& value) {
    std::string normalized = value;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized == "true" || normalized == "1" || normalized == "yes") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no") {
        return false;
    }
    throw std::invalid_argument("invalid boolean value '" + value + "'");
}

} // namespace ioc::text
