#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <spdlog/spdlog.h>
#include "UAC/DescriptorParser.hpp"
#include "UAC/SignalPathTracer.hpp"
#include "UAC/TopologyBuilder.hpp"
#include "Fixtures.hpp"
#include <vector>

using namespace UAC;
using ::testing::ElementsAre;

namespace {

InputTerminal makeInput(EntityId id, uint16_t type, uint8_t channels = 2) {
    InputTerminal t;
    t.terminalId = id;
    t.terminalType = type;
    t.nrChannels = channels;
    return t;
}

OutputTerminal makeOutput(EntityId id, uint16_t type, EntityId source) {
    OutputTerminal t;
    t.terminalId = id;
    t.terminalType = type;
    t.sourceId = source;
    return t;
}

FeatureUnit makeFeature(EntityId id, EntityId source, uint32_t masterControls = 0) {
    FeatureUnit u;
    u.unitId = id;
    u.sourceId = source;
    u.controls = {masterControls, 0, 0};
    u.nrChannels = 2;
    return u;
}

} // namespace

class SignalPathTracerTest : public ::testing::Test {
protected:
    TopologyGraph build(const AudioControlInterface& ac) {
        return TopologyBuilder(spdlog::default_logger()).build(ac);
    }
};

TEST_F(SignalPathTracerTest, Uac1HeadsetPaths) {
    Device device = parseDescriptors(Fixtures::kUac1Headset);
    auto graph = buildTopology(device);
    const auto& paths = graph.signalPaths();
    ASSERT_EQ(paths.size(), 2u);

    EXPECT_THAT(paths[0].nodeIds(), ElementsAre(1, 5, 6));
    EXPECT_EQ(paths[0].description, "USB Streaming -> Feature (Mute, Volume) -> Speaker");
    EXPECT_TRUE(paths[0].isPlayback());
    EXPECT_FALSE(paths[0].isCapture());

    EXPECT_THAT(paths[1].nodeIds(), ElementsAre(2, 4, 7));
    EXPECT_EQ(paths[1].description, "Microphone -> Feature (Mute, Volume, AGC) -> USB Streaming");
    EXPECT_TRUE(paths[1].isCapture());
    EXPECT_FALSE(paths[1].isPlayback());

    ASSERT_EQ(graph.playbackPaths().size(), 1u);
    ASSERT_EQ(graph.capturePaths().size(), 1u);
    EXPECT_TRUE(graph.internalPaths().empty());
}

TEST_F(SignalPathTracerTest, Uac2PathsIgnoreClockEntities) {
    Device device = parseDescriptors(Fixtures::kUac2Interface);
    auto graph = buildTopology(device);
    const auto& paths = graph.signalPaths();
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_THAT(paths[0].nodeIds(), ElementsAre(1, 10, 20));
    EXPECT_EQ(paths[0].description, "USB Streaming -> Feature (Mute, Volume) -> Line Connector");
    EXPECT_THAT(paths[1].nodeIds(), ElementsAre(2, 22));
    EXPECT_EQ(paths[1].description, "Line Connector -> USB Streaming");
}

TEST_F(SignalPathTracerTest, MixerYieldsOnePathPerInput) {
    AudioControlInterface ac;
    ac.inputTerminals.push_back(makeInput(1, 0x0101));
    ac.inputTerminals.push_back(makeInput(2, 0x0201, 1));
    MixerUnit mixer;
    mixer.unitId = 8;
    mixer.nrInPins = 2;
    mixer.sourceIds = {1, 2};
    mixer.nrChannels = 2;
    ac.mixerUnits.push_back(mixer);
    ac.outputTerminals.push_back(makeOutput(9, 0x0302, 8));

    auto graph = build(ac);
    const auto& paths = graph.signalPaths();
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_THAT(paths[0].nodeIds(), ElementsAre(1, 8, 9));
    EXPECT_EQ(paths[0].description, "USB Streaming -> Mixer -> Headphones");
    EXPECT_THAT(paths[1].nodeIds(), ElementsAre(2, 8, 9));
    EXPECT_EQ(paths[1].description, "Microphone -> Mixer -> Headphones");
    EXPECT_TRUE(paths[0].isPlayback());
    EXPECT_FALSE(paths[1].isPlayback());
    EXPECT_FALSE(paths[1].isCapture());
    ASSERT_EQ(graph.internalPaths().size(), 1u);
    EXPECT_THAT(graph.internalPaths()[0].nodeIds(), ElementsAre(2, 8, 9));
}

TEST_F(SignalPathTracerTest, CycleIsAbandoned) {
    // 1 -> 5 -> 6 -> 5 loop, with 6 feeding output 7
    AudioControlInterface ac;
    ac.inputTerminals.push_back(makeInput(1, 0x0101));
    MixerUnit mixer;
    mixer.unitId = 5;
    mixer.nrInPins = 2;
    mixer.sourceIds = {6, 1};
    ac.mixerUnits.push_back(mixer);
    ac.featureUnits.push_back(makeFeature(6, 5));
    ac.outputTerminals.push_back(makeOutput(7, 0x0301, 6));

    auto graph = build(ac);
    const auto& paths = graph.signalPaths();
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_THAT(paths[0].nodeIds(), ElementsAre(1, 5, 6, 7));
    EXPECT_EQ(paths[0].description, "USB Streaming -> Mixer -> Feature -> Speaker");
}

TEST_F(SignalPathTracerTest, DeadEndProducesNoPath) {
    AudioControlInterface ac;
    SelectorUnit selector;
    selector.unitId = 3;
    selector.nrInPins = 0;
    ac.selectorUnits.push_back(selector);
    ac.outputTerminals.push_back(makeOutput(4, 0x0301, 3));

    auto graph = build(ac);
    EXPECT_EQ(graph.edges().size(), 1u);
    EXPECT_TRUE(graph.signalPaths().empty());
}

TEST_F(SignalPathTracerTest, InputWiredDirectlyToOutput) {
    AudioControlInterface ac;
    ac.inputTerminals.push_back(makeInput(1, 0x0101));
    ac.outputTerminals.push_back(makeOutput(2, 0x0101, 1));

    auto graph = build(ac);
    ASSERT_EQ(graph.signalPaths().size(), 1u);
    const auto& path = graph.signalPaths()[0];
    EXPECT_TRUE(path.isPlayback());
    EXPECT_TRUE(path.isCapture());
    EXPECT_EQ(path.description, "USB Streaming -> USB Streaming");
    EXPECT_EQ(graph.playbackPaths().size(), 1u);
    EXPECT_EQ(graph.capturePaths().size(), 1u);
}

TEST_F(SignalPathTracerTest, DescribesEveryUnitKind) {
    AudioControlInterface ac;
    ac.inputTerminals.push_back(makeInput(1, 0x0603));
    SelectorUnit selector;
    selector.unitId = 2;
    selector.nrInPins = 1;
    selector.sourceIds = {1};
    ac.selectorUnits.push_back(selector);
    ProcessingUnit processing;
    processing.unitId = 3;
    processing.processType = 0x03;
    processing.sourceIds = {2};
    ac.processingUnits.push_back(processing);
    ExtensionUnit extension;
    extension.unitId = 4;
    extension.extensionCode = 0x1234;
    extension.sourceIds = {3};
    ac.extensionUnits.push_back(extension);
    ac.outputTerminals.push_back(makeOutput(5, 0x0101, 4));

    auto graph = build(ac);
    ASSERT_EQ(graph.signalPaths().size(), 1u);
    EXPECT_EQ(graph.signalPaths()[0].description,
              "Line Connector -> Selector -> Stereo Extender -> Extension -> USB Streaming");
    EXPECT_EQ(graph.node(4)->description, "Extension (0x1234)");
}

TEST_F(SignalPathTracerTest, PathsGroupedByOutputTerminal) {
    AudioControlInterface ac;
    ac.inputTerminals.push_back(makeInput(1, 0x0101));
    ac.featureUnits.push_back(makeFeature(3, 1, 0x01));
    ac.outputTerminals.push_back(makeOutput(10, 0x0301, 3));
    ac.outputTerminals.push_back(makeOutput(11, 0x0302, 3));

    auto graph = build(ac);
    const auto& paths = graph.signalPaths();
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_THAT(paths[0].nodeIds(), ElementsAre(1, 3, 10));
    EXPECT_THAT(paths[1].nodeIds(), ElementsAre(1, 3, 11));
    EXPECT_EQ(paths[1].description, "USB Streaming -> Feature (Mute) -> Headphones");
}

TEST_F(SignalPathTracerTest, TraceOnEmptyGraph) {
    TopologyGraph graph;
    EXPECT_TRUE(traceSignalPaths(graph).empty());
    EXPECT_TRUE(SignalPathTracer::describe({}).empty());
}
