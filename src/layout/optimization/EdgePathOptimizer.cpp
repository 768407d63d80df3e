#include "orthograph/layout/EdgePathOptimizer.h"
#include "PathCleanup.h"
#include "ChannelCentering.h"
#include "../routing/EdgeNudger.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"

#include <unordered_map>

namespace orthograph {

namespace {

struct Job {
    EdgeId id = INVALID_EDGE;
    Point sourceCenter;
    Point targetCenter;
    std::vector<Rect> obstacles;
};

std::vector<Point> fullPath(const Job& job, const std::vector<Point>& waypoints) {
    std::vector<Point> path;
    path.reserve(waypoints.size() + 2);
    path.push_back(job.sourceCenter);
    path.insert(path.end(), waypoints.begin(), waypoints.end());
    path.push_back(job.targetCenter);
    return path;
}

std::vector<Point> stripAndSnap(const std::vector<Point>& path, float gridSize) {
    std::vector<Point> waypoints;
    if (path.size() <= 2) return waypoints;
    waypoints.reserve(path.size() - 2);
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        waypoints.push_back(grid::snapWaypoint(path[i], gridSize, path.front(), path.back()));
    }
    PathCleanup::removeDuplicates(waypoints);
    return waypoints;
}

}  // namespace

std::vector<Point> EdgePathOptimizer::optimizePath(const std::vector<Point>& path,
                                                   const std::vector<Rect>& obstacles) const {
    std::vector<Point> result = path;
    if (options_.removeCollinear) {
        result = PathCleanup::removeCollinear(result);
    }
    if (options_.straighten) {
        result = PathCleanup::straighten(result, options_.straightenThreshold);
    }
    if (options_.shortenDetours) {
        result = PathCleanup::shortenDetours(result, obstacles, options_.margin);
    }
    if (options_.centerInChannels) {
        result = ChannelCentering::center(result, obstacles, options_.margin);
    }
    return result;
}

int EdgePathOptimizer::optimize(Diagram& diagram) {
    return optimizeConnectors(diagram, diagram.connectors());
}

int EdgePathOptimizer::optimizeConnectors(Diagram& diagram, const std::vector<EdgeId>& connectors) {
    stats_ = OptimizationStats{};

    const auto bounds = diagram.allAbsoluteBounds();
    const std::vector<NodeId> nodeIds = diagram.nodes();
    const float gridSize = diagram.gridSize();

    std::vector<Job> jobs;
    std::unordered_map<EdgeId, std::vector<Point>> original;
    for (EdgeId id : connectors) {
        if (!diagram.hasConnector(id)) continue;
        const ConnectorData& c = diagram.getConnector(id);
        if (c.waypoints.empty()) continue;

        auto src = bounds.find(c.source);
        auto tgt = bounds.find(c.target);
        if (src == bounds.end() || tgt == bounds.end()) {
            LOG_DEBUG("connector {} skipped: unknown endpoint", id);
            continue;
        }

        Job job;
        job.id = id;
        job.sourceCenter = src->second.center();
        job.targetCenter = tgt->second.center();
        for (NodeId n : nodeIds) {
            if (n == c.source || n == c.target) continue;
            if (diagram.isAncestorOf(n, c.source) || diagram.isAncestorOf(n, c.target)) continue;
            if (diagram.isAncestorOf(c.source, n) || diagram.isAncestorOf(c.target, n)) continue;
            job.obstacles.push_back(bounds.at(n));
        }
        original.emplace(id, c.waypoints);
        jobs.push_back(std::move(job));
    }
    stats_.examined = static_cast<int>(jobs.size());
    if (jobs.empty()) {
        return 0;
    }

    EdgeNudger::Config nudgeConfig;
    nudgeConfig.spacing = options_.nudgeSpacing;
    nudgeConfig.gridSize = gridSize;
    nudgeConfig.enabled = options_.separateParallel;
    EdgeNudger nudger(nudgeConfig);

    for (int round = 0; round < MAX_ROUNDS; ++round) {
        ++stats_.rounds;

        std::vector<EdgeNudger::ConnectorPath> paths;
        paths.reserve(jobs.size());
        for (const auto& job : jobs) {
            auto path = fullPath(job, diagram.waypoints(job.id));
            paths.push_back({job.id, optimizePath(path, job.obstacles)});
        }

        stats_.segmentsSeparated += nudger.apply(paths).movedSegments;

        bool changed = false;
        for (size_t i = 0; i < jobs.size(); ++i) {
            auto waypoints = stripAndSnap(paths[i].points, gridSize);
            if (waypoints != diagram.waypoints(jobs[i].id)) {
                diagram.setWaypoints(jobs[i].id, std::move(waypoints));
                changed = true;
            }
        }
        if (!changed) break;
    }

    for (const auto& job : jobs) {
        const auto& now = diagram.waypoints(job.id);
        const auto& before = original.at(job.id);
        if (now != before) {
            ++stats_.modified;
            stats_.waypointsRemoved += static_cast<int>(before.size()) - static_cast<int>(now.size());
        }
    }

    LOG_DEBUG("optimized {} of {} connectors in {} rounds ({} waypoints removed, {} segments separated)",
              stats_.modified, stats_.examined, stats_.rounds,
              stats_.waypointsRemoved, stats_.segmentsSeparated);
    return stats_.modified;
}

}  // namespace orthograph
