// include/UAC/TopologyBuilder.hpp
#pragma once

#include <memory>
#include "UAC/AudioControl.hpp"
#include "UAC/TopologyGraph.hpp"

namespace spdlog {
    class logger;
}

namespace UAC {

class Device;

/**
 * @brief Converts an AudioControl interface into a TopologyGraph.
 *
 * One node per terminal, unit and clock entity; one edge per source
 * reference that resolves to a node. Signal paths are traced once the
 * edges are in place. Building never fails and the result depends only
 * on the input interface.
 */
class TopologyBuilder {
public:
    explicit TopologyBuilder(std::shared_ptr<spdlog::logger> logger = nullptr);

    TopologyGraph build(const AudioControlInterface& ac) const;

private:
    void addNode(TopologyGraph& graph, TopologyNode node) const;
    void addEdge(TopologyGraph& graph, EntityId sourceId, EntityId targetId, bool isClock) const;

    std::shared_ptr<spdlog::logger> logger_;
};

TopologyGraph buildTopology(const AudioControlInterface& ac);

/**
 * @brief Graph of the device's active configuration; empty when it has no AudioControl interface.
 */
TopologyGraph buildTopology(const Device& device);

} // namespace UAC
