// TopologyBuilder.cpp
#include "UAC/TopologyBuilder.hpp"
#include "UAC/Device.hpp"
#include "UAC/JsonHelpers.hpp"
#include "UAC/SignalPathTracer.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace UAC {

TopologyBuilder::TopologyBuilder(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger())
{}

void TopologyBuilder::addNode(TopologyGraph& graph, TopologyNode node) const {
    if (graph.index_.contains(node.id)) {
        logger_->warn("TopologyBuilder: Duplicate entity id {} ({}), keeping the first",
                      node.id, JsonHelpers::nodeTypeToString(node.type));
        return;
    }
    graph.index_.emplace(node.id, graph.nodes_.size());
    graph.nodes_.push_back(std::move(node));
}

void TopologyBuilder::addEdge(TopologyGraph& graph, EntityId sourceId, EntityId targetId, bool isClock) const {
    // Id 0 is reserved for "not connected", even if an entity decoded to it
    if (sourceId == 0) return;
    const TopologyNode* source = graph.node(sourceId);
    if (!source || !graph.node(targetId)) {
        logger_->debug("TopologyBuilder: Dropping reference {} -> {}, no such entity", sourceId, targetId);
        return;
    }
    graph.edges_.push_back(TopologyEdge{sourceId, targetId, source->channels, isClock});
}

TopologyGraph TopologyBuilder::build(const AudioControlInterface& ac) const {
    TopologyGraph graph;

    for (const auto& t : ac.inputTerminals) {
        TopologyNode node;
        node.id = t.terminalId;
        node.type = NodeType::InputTerminal;
        node.description = t.terminalTypeName();
        node.name = t.terminalName.empty() ? node.description : t.terminalName;
        node.channels = t.nrChannels;
        node.usbStreaming = t.isUsbStreaming();
        node.entity = t;
        addNode(graph, std::move(node));
    }

    for (const auto& t : ac.outputTerminals) {
        TopologyNode node;
        node.id = t.terminalId;
        node.type = NodeType::OutputTerminal;
        node.description = t.terminalTypeName();
        node.name = t.terminalName.empty() ? node.description : t.terminalName;
        node.channels = 0;  // output terminals declare no channel count
        node.usbStreaming = t.isUsbStreaming();
        node.entity = t;
        addNode(graph, std::move(node));
    }

    for (const auto& u : ac.featureUnits) {
        TopologyNode node;
        node.id = u.unitId;
        node.type = NodeType::FeatureUnit;
        node.name = u.unitName.empty() ? fmt::format("Feature Unit {}", u.unitId) : u.unitName;
        node.description = "Feature Unit";
        node.channels = u.nrChannels;
        node.controls = u.controlNames();
        node.entity = u;
        addNode(graph, std::move(node));
    }

    for (const auto& u : ac.mixerUnits) {
        TopologyNode node;
        node.id = u.unitId;
        node.type = NodeType::MixerUnit;
        node.name = u.unitName.empty() ? fmt::format("Mixer Unit {}", u.unitId) : u.unitName;
        node.description = fmt::format("Mixer ({} inputs)", u.nrInPins);
        node.channels = u.nrChannels;
        node.entity = u;
        addNode(graph, std::move(node));
    }

    for (const auto& u : ac.selectorUnits) {
        TopologyNode node;
        node.id = u.unitId;
        node.type = NodeType::SelectorUnit;
        node.name = u.selectorName.empty() ? fmt::format("Selector Unit {}", u.unitId) : u.selectorName;
        node.description = fmt::format("Selector ({} inputs)", u.nrInPins);
        node.channels = 0;
        node.entity = u;
        addNode(graph, std::move(node));
    }

    for (const auto& u : ac.processingUnits) {
        TopologyNode node;
        node.id = u.unitId;
        node.type = NodeType::ProcessingUnit;
        node.name = u.unitName.empty() ? fmt::format("Processing Unit {}", u.unitId) : u.unitName;
        node.description = u.processTypeName();
        node.channels = u.nrChannels;
        node.entity = u;
        addNode(graph, std::move(node));
    }

    for (const auto& u : ac.extensionUnits) {
        TopologyNode node;
        node.id = u.unitId;
        node.type = NodeType::ExtensionUnit;
        node.name = u.unitName.empty() ? fmt::format("Extension Unit {}", u.unitId) : u.unitName;
        node.description = fmt::format("Extension (0x{:04X})", u.extensionCode);
        node.channels = u.nrChannels;
        node.entity = u;
        addNode(graph, std::move(node));
    }

    for (const auto& c : ac.clockSources) {
        TopologyNode node;
        node.id = c.clockId;
        node.type = NodeType::ClockSource;
        node.name = c.name.empty() ? fmt::format("Clock Source {}", c.clockId) : c.name;
        node.description = c.clockTypeName();
        node.entity = c;
        addNode(graph, std::move(node));
    }

    for (const auto& c : ac.clockSelectors) {
        TopologyNode node;
        node.id = c.clockId;
        node.type = NodeType::ClockSelector;
        node.name = c.name.empty() ? fmt::format("Clock Selector {}", c.clockId) : c.name;
        node.description = fmt::format("Clock Selector ({} inputs)", c.nrInPins);
        node.entity = c;
        addNode(graph, std::move(node));
    }

    for (const auto& c : ac.clockMultipliers) {
        TopologyNode node;
        node.id = c.clockId;
        node.type = NodeType::ClockMultiplier;
        node.name = c.name.empty() ? fmt::format("Clock Multiplier {}", c.clockId) : c.name;
        node.description = "Clock Multiplier";
        node.entity = c;
        addNode(graph, std::move(node));
    }

    // Edges run from the referenced source to the entity that references it
    for (const auto& t : ac.outputTerminals) addEdge(graph, t.sourceId, t.terminalId, false);
    for (const auto& u : ac.featureUnits) addEdge(graph, u.sourceId, u.unitId, false);
    for (const auto& u : ac.mixerUnits) {
        for (auto src : u.sourceIds) addEdge(graph, src, u.unitId, false);
    }
    for (const auto& u : ac.selectorUnits) {
        for (auto src : u.sourceIds) addEdge(graph, src, u.unitId, false);
    }
    for (const auto& u : ac.processingUnits) {
        for (auto src : u.sourceIds) addEdge(graph, src, u.unitId, false);
    }
    for (const auto& u : ac.extensionUnits) {
        for (auto src : u.sourceIds) addEdge(graph, src, u.unitId, false);
    }
    for (const auto& c : ac.clockSelectors) {
        for (auto pin : c.clockPinIds) addEdge(graph, pin, c.clockId, true);
    }
    for (const auto& c : ac.clockMultipliers) addEdge(graph, c.clockSourceId, c.clockId, true);

    graph.paths_ = SignalPathTracer(graph, logger_).trace();

    logger_->debug("TopologyBuilder: {} nodes, {} edges, {} signal paths",
                   graph.nodes_.size(), graph.edges_.size(), graph.paths_.size());
    return graph;
}

TopologyGraph buildTopology(const AudioControlInterface& ac) {
    return TopologyBuilder().build(ac);
}

TopologyGraph buildTopology(const Device& device) {
    const AudioControlInterface* ac = device.audioControl();
    if (!ac) {
        spdlog::debug("TopologyBuilder: Active configuration has no AudioControl interface");
        return TopologyGraph{};
    }
    return TopologyBuilder().build(*ac);
}

} // namespace UAC
