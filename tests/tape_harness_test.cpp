#include "harness/harness.hpp"
#include "tape_frame_codec.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(TapeWireHarness, ParsesScriptedCommands) {
    auto command = TapeWireHarness::parseCommand(nlohmann::json::parse(R"({"act":"step"})"));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, TapeBackendCommand::Step);

    command = TapeWireHarness::parseCommand(
        nlohmann::json::parse(R"({"act":"break","param":16})"));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, TapeBackendCommand::SetBreakpoint);
    EXPECT_EQ(command->address, 16);

    command = TapeWireHarness::parseCommand(
        nlohmann::json::parse(R"({"act":"memory","param":{"from":0,"to":16}})"));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->addressEnd, 16);

    command = TapeWireHarness::parseCommand(
        nlohmann::json::parse(R"({"act":"register","param":{"id":"d0","value":50}})"));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->registerId, TAPE_REG_D0);
    EXPECT_EQ(command->value, 50);

    command = TapeWireHarness::parseCommand(
        nlohmann::json::parse(R"({"act":"poke","param":{"address":4,"bytes":[1,2,255]}})"));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->bytes, (std::vector<uint8_t>{1, 2, 255}));

    command = TapeWireHarness::parseCommand(nlohmann::json::parse(R"({"act":"key","param":27})"));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->key, TAPE_KEY_ESCAPE);
}

TEST(TapeWireHarness, RejectsMalformedCommands) {
    for (auto text : {R"({"act":"jump"})", R"({"param":1})", R"({"act":"break"})",
                      R"({"act":"break","param":70000})", R"({"act":"key","param":"ab"})",
                      R"({"act":"key","param":127})", R"({"act":"memory","param":{"from":1}})",
                      R"({"act":"register","param":{"id":"zz","value":1}})",
                      R"({"act":"poke","param":{"address":0,"bytes":[256]}})", R"([1,2])"}) {
        EXPECT_FALSE(TapeWireHarness::parseCommand(nlohmann::json::parse(text)).has_value())
            << text;
    }
}

TEST(TapeWireHarness, RunWritesFrames) {
    TapeWireHarness harness;
    std::ostringstream output;
    EXPECT_TRUE(harness.run(nlohmann::json::parse(R"({"act":"break","param":258})"), output));
    EXPECT_TRUE(harness.run(nlohmann::json::parse(R"({"act":"stop"})"), output));
    EXPECT_EQ(output.str(), std::string("b\x01\x02q", 4));
    EXPECT_EQ(harness.getFrameCount(), 2u);

    EXPECT_FALSE(harness.run(nlohmann::json::parse(R"({"act":"nope"})"), output));
    EXPECT_TRUE(harness.hasFailed());
}

TEST(TapeWireHarness, DecodePrintsLogicalEvents) {
    std::string wire;
    TapeBackendEvent output;
    output.type = TapeBackendEvent::Output;
    output.text.assign(300, 'o');
    TapeBackendEvent hit;
    hit.type = TapeBackendEvent::BreakpointHit;
    hit.address = 5;
    for (auto &event : {output, hit}) {
        for (auto &frame : TapeFrameCodec::encodeEvent(event)) {
            wire.append(frame.begin(), frame.end());
        }
    }

    TapeWireHarness harness;
    std::istringstream input(wire);
    std::ostringstream printed;
    EXPECT_TRUE(harness.decode(input, printed));
    EXPECT_EQ(harness.getFrameCount(), 3u);

    std::istringstream lines(printed.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    auto first = nlohmann::json::parse(line);
    EXPECT_EQ(first["event"], "output");
    EXPECT_EQ(first["text"].get<std::string>().size(), 300u);
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line, R"({"event":"breakpoint","address":5})");
    EXPECT_FALSE(std::getline(lines, line));
}

TEST(TapeWireHarness, DecodeReportsGarbage) {
    TapeWireHarness harness;
    std::istringstream input(std::string("\x01\x02k", 3));
    std::ostringstream printed;
    EXPECT_FALSE(harness.decode(input, printed));
    EXPECT_EQ(printed.str(), "{\"event\":\"key_requested\"}\n");
}
