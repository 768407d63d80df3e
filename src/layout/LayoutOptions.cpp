#include "orthograph/layout/config/LayoutOptions.h"

#include <algorithm>
#include <cctype>

namespace orthograph {

const char* directionCode(Direction d) {
    switch (d) {
        case Direction::TopToBottom: return "TB";
        case Direction::BottomToTop: return "BT";
        case Direction::LeftToRight: return "LR";
        case Direction::RightToLeft: return "RL";
    }
    return "TB";
}

std::optional<Direction> parseDirection(const std::string& code) {
    std::string key(code);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (key == "TB") return Direction::TopToBottom;
    if (key == "BT") return Direction::BottomToTop;
    if (key == "LR") return Direction::LeftToRight;
    if (key == "RL") return Direction::RightToLeft;
    return std::nullopt;
}

}  // namespace orthograph
