#include "orthograph/layout/util/LayoutSerializer.h"
#include "orthograph/layout/config/LayoutOptions.h"
#include "orthograph/layout/config/LayoutResult.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace orthograph {

std::string LayoutSerializer::toJson(const LayoutOptions& options) {
    json j;
    j["version"] = 1;
    j["direction"] = directionCode(options.direction);
    j["rankSpacing"] = options.rankSpacing;
    j["nodeSpacing"] = options.nodeSpacing;
    j["defaultNodeSize"] = {{"width", options.defaultNodeWidth}, {"height", options.defaultNodeHeight}};
    j["gridSize"] = options.gridSize;
    j["overlap"] = {
        {"maxIterations", options.maxOverlapIterations},
        {"padding", options.overlapPadding}
    };
    j["crossingMinimizationPasses"] = options.crossingMinimizationPasses;
    j["edgeMargin"] = options.edgeMargin;
    j["routeEdges"] = options.routeEdges;
    j["origin"] = {{"x", options.startX}, {"y", options.startY}};
    return j.dump(2);
}

bool LayoutSerializer::fromJson(LayoutOptions& options, const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        LayoutOptions parsed = options;

        if (j.contains("direction")) {
            auto direction = parseDirection(j["direction"].get<std::string>());
            if (!direction) return false;
            parsed.direction = *direction;
        }
        parsed.rankSpacing = j.value("rankSpacing", parsed.rankSpacing);
        parsed.nodeSpacing = j.value("nodeSpacing", parsed.nodeSpacing);
        if (j.contains("defaultNodeSize")) {
            const auto& size = j["defaultNodeSize"];
            parsed.defaultNodeWidth = size.value("width", parsed.defaultNodeWidth);
            parsed.defaultNodeHeight = size.value("height", parsed.defaultNodeHeight);
        }
        parsed.gridSize = j.value("gridSize", parsed.gridSize);
        if (j.contains("overlap")) {
            const auto& overlap = j["overlap"];
            parsed.maxOverlapIterations = overlap.value("maxIterations", parsed.maxOverlapIterations);
            parsed.overlapPadding = overlap.value("padding", parsed.overlapPadding);
        }
        parsed.crossingMinimizationPasses = j.value("crossingMinimizationPasses", parsed.crossingMinimizationPasses);
        parsed.edgeMargin = j.value("edgeMargin", parsed.edgeMargin);
        parsed.routeEdges = j.value("routeEdges", parsed.routeEdges);
        if (j.contains("origin")) {
            parsed.startX = j["origin"].value("x", parsed.startX);
            parsed.startY = j["origin"].value("y", parsed.startY);
        }

        options = parsed;
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

bool LayoutSerializer::saveToFile(const LayoutOptions& options, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(options);
    return static_cast<bool>(file);
}

bool LayoutSerializer::loadFromFile(LayoutOptions& options, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(options, buffer.str());
}

std::string LayoutSerializer::toJson(const OptimizerOptions& options) {
    json j;
    j["margin"] = options.margin;
    j["straightenThreshold"] = options.straightenThreshold;
    j["nudgeSpacing"] = options.nudgeSpacing;
    j["passes"] = {
        {"removeCollinear", options.removeCollinear},
        {"straighten", options.straighten},
        {"shortenDetours", options.shortenDetours},
        {"centerInChannels", options.centerInChannels},
        {"separateParallel", options.separateParallel}
    };
    return j.dump(2);
}

bool LayoutSerializer::fromJson(OptimizerOptions& options, const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        OptimizerOptions parsed = options;

        parsed.margin = j.value("margin", parsed.margin);
        parsed.straightenThreshold = j.value("straightenThreshold", parsed.straightenThreshold);
        parsed.nudgeSpacing = j.value("nudgeSpacing", parsed.nudgeSpacing);
        if (j.contains("passes")) {
            const auto& passes = j["passes"];
            parsed.removeCollinear = passes.value("removeCollinear", parsed.removeCollinear);
            parsed.straighten = passes.value("straighten", parsed.straighten);
            parsed.shortenDetours = passes.value("shortenDetours", parsed.shortenDetours);
            parsed.centerInChannels = passes.value("centerInChannels", parsed.centerInChannels);
            parsed.separateParallel = passes.value("separateParallel", parsed.separateParallel);
        }

        options = parsed;
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["layerCount"] = result.layerCount();

    // Sorted by id so equal results serialize identically
    std::vector<NodeId> ids;
    ids.reserve(result.nodeCount());
    for (const auto& [id, layout] : result.nodeLayouts()) ids.push_back(id);
    std::sort(ids.begin(), ids.end());

    json nodeLayouts = json::array();
    for (NodeId id : ids) {
        const NodeLayout& layout = *result.getNodeLayout(id);
        json nodeJson;
        nodeJson["id"] = id;
        nodeJson["label"] = layout.label;
        nodeJson["position"] = {{"x", layout.position.x}, {"y", layout.position.y}};
        nodeJson["size"] = {{"width", layout.size.width}, {"height", layout.size.height}};
        nodeJson["layer"] = layout.layer;
        nodeJson["order"] = layout.order;
        nodeLayouts.push_back(nodeJson);
    }
    j["nodeLayouts"] = nodeLayouts;
    j["connectors"] = result.connectors();

    return j.dump(2);
}

LayoutResult LayoutSerializer::layoutResultFromJson(const std::string& jsonStr) {
    LayoutResult result;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("layerCount")) {
            result.setLayerCount(j["layerCount"].get<int>());
        }

        if (j.contains("nodeLayouts")) {
            for (const auto& nodeJson : j["nodeLayouts"]) {
                NodeLayout layout;
                layout.id = nodeJson.at("id").get<NodeId>();
                layout.label = nodeJson.value("label", std::string{});
                layout.position.x = nodeJson.at("position").at("x").get<float>();
                layout.position.y = nodeJson.at("position").at("y").get<float>();
                layout.size.width = nodeJson.at("size").at("width").get<float>();
                layout.size.height = nodeJson.at("size").at("height").get<float>();
                layout.layer = nodeJson.value("layer", 0);
                layout.order = nodeJson.value("order", 0);
                result.setNodeLayout(layout.id, layout);
            }
        }

        if (j.contains("connectors")) {
            for (const auto& id : j["connectors"]) {
                result.addConnector(id.get<EdgeId>());
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse layout result: ") + e.what());
    }

    return result;
}

}  // namespace orthograph
