#include "orthograph/layout/util/LabelMetrics.h"

#include <algorithm>
#include <regex>
#include <sstream>

namespace orthograph {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // namespace

std::vector<std::string> LabelMetrics::visibleLines(const std::string& label) {
    static const std::regex lineBreak(R"(<br\s*/?>)", std::regex::icase);
    static const std::regex tag(R"(<[^>]+>)");

    std::string text = std::regex_replace(label, lineBreak, "\n");
    text = std::regex_replace(text, tag, "");
    replaceAll(text, "&amp;", "&");
    replaceAll(text, "&lt;", "<");
    replaceAll(text, "&gt;", ">");

    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

size_t LabelMetrics::characterCount(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

Size LabelMetrics::estimateNodeSize(const std::string& label, Size defaultSize) {
    auto lines = visibleLines(label);

    size_t longest = 1;  // an empty label still measures as one character
    for (const auto& line : lines) {
        longest = std::max(longest, characterCount(line));
    }
    size_t lineCount = std::max<size_t>(lines.size(), 1);

    float width = std::min(MAX_WIDTH, static_cast<float>(longest) * CHARACTER_WIDTH + HORIZONTAL_PADDING);
    float height = std::min(MAX_HEIGHT, static_cast<float>(lineCount) * LINE_HEIGHT + VERTICAL_PADDING);
    return {std::max(defaultSize.width, width), std::max(defaultSize.height, height)};
}

}  // namespace orthograph
