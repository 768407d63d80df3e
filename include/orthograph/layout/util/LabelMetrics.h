#pragma once

#include "../../core/Types.h"

#include <string>
#include <vector>

namespace orthograph {

/// Text-based node size estimation for labels that may contain simple HTML
class LabelMetrics {
public:
    static constexpr float CHARACTER_WIDTH = 8.0f;
    static constexpr float LINE_HEIGHT = 22.0f;
    static constexpr float HORIZONTAL_PADDING = 20.0f;
    static constexpr float VERTICAL_PADDING = 16.0f;
    static constexpr float MAX_WIDTH = 280.0f;
    static constexpr float MAX_HEIGHT = 200.0f;

    /// Visible text lines: <br> breaks lines, other tags are dropped,
    /// &amp; &lt; &gt; are decoded, blank lines are skipped.
    static std::vector<std::string> visibleLines(const std::string& label);

    /// Number of UTF-8 code points in text
    static size_t characterCount(const std::string& text);

    /// Size that fits the label, never smaller than defaultSize and
    /// capped at MAX_WIDTH x MAX_HEIGHT (unless the default is larger)
    static Size estimateNodeSize(const std::string& label, Size defaultSize);
};

}  // namespace orthograph
