#pragma once

#include <string>

namespace orthograph {

// Forward declarations
struct LayoutOptions;
struct OptimizerOptions;
class LayoutResult;

/// JSON serialization for layout configuration and results
class LayoutSerializer {
public:
    // === LayoutOptions ===

    static std::string toJson(const LayoutOptions& options);

    /// Missing keys keep the current value of options.
    /// @return false on malformed JSON, wrong value types or an unknown direction
    static bool fromJson(LayoutOptions& options, const std::string& json);

    static bool saveToFile(const LayoutOptions& options, const std::string& path);
    static bool loadFromFile(LayoutOptions& options, const std::string& path);

    // === OptimizerOptions ===

    static std::string toJson(const OptimizerOptions& options);
    static bool fromJson(OptimizerOptions& options, const std::string& json);

    // === LayoutResult serialization ===

    static std::string toJson(const LayoutResult& result);

    /// Deserialize JSON string to layout result
    /// @throws std::runtime_error if parsing fails
    static LayoutResult layoutResultFromJson(const std::string& json);
};

}  // namespace orthograph
