// include/UAC/SignalPathTracer.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "UAC/TopologyGraph.hpp"

namespace spdlog {
    class logger;
}

namespace UAC {

/**
 * @brief Enumerates every acyclic input-terminal to output-terminal path.
 *
 * Walks backwards from each output terminal along audio (non-clock) edges.
 * A branch that revisits a node already on the current path is abandoned,
 * as is one that ends at a node without sources. Paths are returned grouped
 * by output terminal, in output-terminal order, then in edge order.
 */
class SignalPathTracer {
public:
    explicit SignalPathTracer(const TopologyGraph& graph, std::shared_ptr<spdlog::logger> logger = nullptr);

    std::vector<SignalPath> trace() const;

    /**
     * @brief Text form such as "USB Streaming -> Feature (Mute, Volume) -> Speaker".
     */
    static std::string describe(const std::vector<TopologyNode>& nodes);

private:
    void walkBack(EntityId current, std::vector<EntityId>& trail,
                  std::vector<std::vector<EntityId>>& found) const;

    const TopologyGraph& graph_;
    std::shared_ptr<spdlog::logger> logger_;
};

std::vector<SignalPath> traceSignalPaths(const TopologyGraph& graph);

} // namespace UAC
