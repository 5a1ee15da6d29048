// include/UAC/TopologyGraph.hpp
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "UAC/AudioControl.hpp"
#include "UAC/Enums.hpp"

namespace UAC {

class TopologyBuilder;

/**
 * @brief One terminal, unit or clock entity in the topology graph.
 */
struct TopologyNode {
    EntityId id = 0;
    NodeType type = NodeType::InputTerminal;
    std::string name;                     ///< Entity label, else a generated one
    std::string description;              ///< Terminal type name or unit summary
    uint8_t channels = 0;
    bool usbStreaming = false;            ///< Terminals only
    std::vector<std::string> controls;    ///< Feature units only
    AudioEntity entity;                   ///< Copy of the source entity

    bool isTerminal() const {
        return type == NodeType::InputTerminal || type == NodeType::OutputTerminal;
    }
    bool isClock() const {
        return type == NodeType::ClockSource || type == NodeType::ClockSelector ||
               type == NodeType::ClockMultiplier;
    }

    nlohmann::json toJson() const;
};

/**
 * @brief Directed connection from a source entity to the entity consuming it.
 */
struct TopologyEdge {
    EntityId sourceId = 0;
    EntityId targetId = 0;
    uint8_t channels = 0;     ///< Channel count of the source node
    bool isClock = false;     ///< Clock connections never carry audio

    nlohmann::json toJson() const;
};

/**
 * @brief Ordered input-terminal to output-terminal node sequence.
 */
struct SignalPath {
    std::vector<TopologyNode> nodes;
    std::string description;

    const TopologyNode* inputNode() const { return nodes.empty() ? nullptr : &nodes.front(); }
    const TopologyNode* outputNode() const { return nodes.empty() ? nullptr : &nodes.back(); }

    /// Starts at a USB streaming input terminal (host to device).
    bool isPlayback() const { return inputNode() && inputNode()->usbStreaming; }
    /// Ends at a USB streaming output terminal (device to host).
    bool isCapture() const { return outputNode() && outputNode()->usbStreaming; }

    std::vector<EntityId> nodeIds() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Read-only audio topology derived from one AudioControl interface.
 *
 * Built by TopologyBuilder. Node pointers returned by the views stay valid
 * for the lifetime of the graph object.
 */
class TopologyGraph {
    friend class TopologyBuilder;

public:
    TopologyGraph() = default;

    const std::vector<TopologyNode>& nodes() const { return nodes_; }
    const std::vector<TopologyEdge>& edges() const { return edges_; }
    const std::vector<SignalPath>& signalPaths() const { return paths_; }
    bool empty() const { return nodes_.empty(); }

    const TopologyNode* node(EntityId id) const;

    std::vector<const TopologyNode*> inputTerminals() const;
    std::vector<const TopologyNode*> outputTerminals() const;
    std::vector<const TopologyNode*> units() const;
    std::vector<const TopologyNode*> clockEntities() const;
    std::vector<const TopologyNode*> usbInputTerminals() const;
    std::vector<const TopologyNode*> usbOutputTerminals() const;

    /**
     * @brief Nodes feeding audio into id, in edge order. Clock edges are excluded.
     */
    std::vector<const TopologyNode*> sources(EntityId id) const;

    /**
     * @brief Nodes consuming audio from id, in edge order. Clock edges are excluded.
     */
    std::vector<const TopologyNode*> targets(EntityId id) const;

    std::vector<SignalPath> playbackPaths() const;
    std::vector<SignalPath> capturePaths() const;
    std::vector<SignalPath> internalPaths() const;

    nlohmann::json toJson() const;

private:
    template <typename Pred>
    std::vector<const TopologyNode*> collectNodes(Pred pred) const;

    std::vector<TopologyNode> nodes_;
    std::unordered_map<EntityId, size_t> index_;
    std::vector<TopologyEdge> edges_;
    std::vector<SignalPath> paths_;
};

} // namespace UAC
