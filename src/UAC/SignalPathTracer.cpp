// SignalPathTracer.cpp
#include "UAC/SignalPathTracer.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace UAC {

SignalPathTracer::SignalPathTracer(const TopologyGraph& graph, std::shared_ptr<spdlog::logger> logger)
    : graph_(graph)
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{}

std::vector<SignalPath> SignalPathTracer::trace() const {
    std::vector<SignalPath> paths;

    for (const TopologyNode* output : graph_.outputTerminals()) {
        std::vector<std::vector<EntityId>> found;
        std::vector<EntityId> trail{output->id};
        walkBack(output->id, trail, found);

        for (const auto& ids : found) {
            SignalPath path;
            // trail runs output -> input
            for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
                if (const auto* n = graph_.node(*it)) path.nodes.push_back(*n);
            }
            if (path.nodes.empty()) continue;
            path.description = describe(path.nodes);
            logger_->trace("SignalPathTracer: {}", path.description);
            paths.push_back(std::move(path));
        }
    }
    return paths;
}

void SignalPathTracer::walkBack(EntityId current, std::vector<EntityId>& trail,
                                std::vector<std::vector<EntityId>>& found) const {
    const TopologyNode* node = graph_.node(current);
    if (!node) return;

    if (node->type == NodeType::InputTerminal) {
        found.push_back(trail);
        return;
    }

    for (const TopologyNode* source : graph_.sources(current)) {
        if (std::find(trail.begin(), trail.end(), source->id) != trail.end()) {
            logger_->debug("SignalPathTracer: Cycle through entity {} ignored", source->id);
            continue;
        }
        trail.push_back(source->id);
        walkBack(source->id, trail, found);
        trail.pop_back();
    }
}

std::string SignalPathTracer::describe(const std::vector<TopologyNode>& nodes) {
    std::string text;
    auto append = [&text](const std::string& part) {
        if (!text.empty()) text += " -> ";
        text += part;
    };

    for (const auto& node : nodes) {
        switch (node.type) {
            case NodeType::InputTerminal:
            case NodeType::OutputTerminal:
            case NodeType::ProcessingUnit:
                append(node.description);
                break;
            case NodeType::FeatureUnit: {
                if (node.controls.empty()) {
                    append("Feature");
                    break;
                }
                std::string part = "Feature (";
                for (size_t i = 0; i < node.controls.size(); ++i) {
                    if (i) part += ", ";
                    part += node.controls[i];
                }
                part += ")";
                append(part);
                break;
            }
            case NodeType::MixerUnit: append("Mixer"); break;
            case NodeType::SelectorUnit: append("Selector"); break;
            case NodeType::ExtensionUnit: append("Extension"); break;
            default: break;
        }
    }
    return text;
}

std::vector<SignalPath> traceSignalPaths(const TopologyGraph& graph) {
    return SignalPathTracer(graph).trace();
}

} // namespace UAC
