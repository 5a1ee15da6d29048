// TopologyGraph.cpp
#include "UAC/TopologyGraph.hpp"
#include "UAC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>

namespace UAC {

using json = nlohmann::json;

json TopologyNode::toJson() const {
    json j;
    j["id"] = id;
    j["type"] = JsonHelpers::nodeTypeToString(type);
    j["name"] = name;
    j["description"] = description;
    j["channels"] = channels;
    if (isTerminal()) j["usbStreaming"] = usbStreaming;
    if (type == NodeType::FeatureUnit) j["controls"] = controls;
    j["entity"] = entityToJson(entity);
    return j;
}

json TopologyEdge::toJson() const {
    json j;
    j["source"] = sourceId;
    j["target"] = targetId;
    j["channels"] = channels;
    j["clock"] = isClock;
    return j;
}

std::vector<EntityId> SignalPath::nodeIds() const {
    std::vector<EntityId> ids;
    ids.reserve(nodes.size());
    for (const auto& n : nodes) ids.push_back(n.id);
    return ids;
}

json SignalPath::toJson() const {
    json j;
    j["nodes"] = nodeIds();
    j["description"] = description;
    if (isPlayback()) {
        j["kind"] = "playback";
    } else if (isCapture()) {
        j["kind"] = "capture";
    } else {
        j["kind"] = "internal";
    }
    return j;
}

const TopologyNode* TopologyGraph::node(EntityId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

template <typename Pred>
std::vector<const TopologyNode*> TopologyGraph::collectNodes(Pred pred) const {
    std::vector<const TopologyNode*> result;
    for (const auto& n : nodes_) {
        if (pred(n)) result.push_back(&n);
    }
    return result;
}

std::vector<const TopologyNode*> TopologyGraph::inputTerminals() const {
    return collectNodes([](const TopologyNode& n) { return n.type == NodeType::InputTerminal; });
}

std::vector<const TopologyNode*> TopologyGraph::outputTerminals() const {
    return collectNodes([](const TopologyNode& n) { return n.type == NodeType::OutputTerminal; });
}

std::vector<const TopologyNode*> TopologyGraph::units() const {
    return collectNodes([](const TopologyNode& n) { return !n.isTerminal() && !n.isClock(); });
}

std::vector<const TopologyNode*> TopologyGraph::clockEntities() const {
    return collectNodes([](const TopologyNode& n) { return n.isClock(); });
}

std::vector<const TopologyNode*> TopologyGraph::usbInputTerminals() const {
    return collectNodes([](const TopologyNode& n) {
        return n.type == NodeType::InputTerminal && n.usbStreaming;
    });
}

std::vector<const TopologyNode*> TopologyGraph::usbOutputTerminals() const {
    return collectNodes([](const TopologyNode& n) {
        return n.type == NodeType::OutputTerminal && n.usbStreaming;
    });
}

std::vector<const TopologyNode*> TopologyGraph::sources(EntityId id) const {
    std::vector<const TopologyNode*> result;
    for (const auto& edge : edges_) {
        if (edge.targetId != id || edge.isClock) continue;
        if (const auto* n = node(edge.sourceId)) result.push_back(n);
    }
    return result;
}

std::vector<const TopologyNode*> TopologyGraph::targets(EntityId id) const {
    std::vector<const TopologyNode*> result;
    for (const auto& edge : edges_) {
        if (edge.sourceId != id || edge.isClock) continue;
        if (const auto* n = node(edge.targetId)) result.push_back(n);
    }
    return result;
}

std::vector<SignalPath> TopologyGraph::playbackPaths() const {
    std::vector<SignalPath> result;
    for (const auto& path : paths_) {
        if (path.isPlayback()) result.push_back(path);
    }
    return result;
}

std::vector<SignalPath> TopologyGraph::capturePaths() const {
    std::vector<SignalPath> result;
    for (const auto& path : paths_) {
        if (path.isCapture()) result.push_back(path);
    }
    return result;
}

std::vector<SignalPath> TopologyGraph::internalPaths() const {
    std::vector<SignalPath> result;
    for (const auto& path : paths_) {
        if (!path.isPlayback() && !path.isCapture()) result.push_back(path);
    }
    return result;
}

json TopologyGraph::toJson() const {
    json j;
    json nodesJson = json::array();
    for (const auto& n : nodes_) nodesJson.push_back(n.toJson());
    j["nodes"] = nodesJson;

    json edgesJson = json::array();
    for (const auto& e : edges_) edgesJson.push_back(e.toJson());
    j["edges"] = edgesJson;

    json pathsJson = json::array();
    for (const auto& p : paths_) pathsJson.push_back(p.toJson());
    j["paths"] = pathsJson;
    return j;
}

} // namespace UAC
