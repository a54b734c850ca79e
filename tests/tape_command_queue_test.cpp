#include "tape_command_queue.hpp"
#include "tape_frame_codec.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

//  Records dispatched commands as readable strings
class RecordingListener : public TapeCommandQueueListener {
  public:
    void onCommandStep(bool ignoreBreakpoints) override {
        calls.push_back(ignoreBreakpoints ? "step_ignore" : "step");
    }
    void onCommandSetBreakpoint(uint16_t address) override {
        calls.push_back("break " + std::to_string(address));
    }
    void onCommandClearBreakpoint(uint16_t address) override {
        calls.push_back("clear " + std::to_string(address));
    }
    void onCommandRequestDump() override { calls.push_back("dump"); }
    void onCommandInputKey(uint8_t key) override {
        calls.push_back(std::string("key ") + (char)key);
    }
    void onCommandInputString(const std::string &text) override {
        calls.push_back("string " + std::to_string(text.size()));
        lastText = text;
    }
    void onCommandRequestMemory(uint16_t from, uint16_t to) override {
        calls.push_back("memory " + std::to_string(from) + " " + std::to_string(to));
    }
    void onCommandRequestStack() override { calls.push_back("stack"); }
    void onCommandSetMemory(uint16_t address, const std::vector<uint8_t> &bytes) override {
        calls.push_back("poke " + std::to_string(address) + " " + std::to_string(bytes.size()));
    }
    void onCommandSetRegister(uint8_t registerId, uint16_t value) override {
        calls.push_back("register " + std::to_string(registerId) + " " + std::to_string(value));
    }
    void onCommandStop() override {
        calls.push_back("stop");
        stopped = true;
    }
    void onCommandDecodeError(const TapeBackendError &error) override {
        calls.push_back(std::string("error ") + getTapeErrorKindName(error.kind));
    }
    bool isCommandQueueHalted() const override { return stopped; }

    std::vector<std::string> calls;
    std::string lastText;
    bool stopped = false;
};

void receiveCommand(TapeCommandQueue &queue, const TapeBackendCommand &command) {
    for (auto &frame : TapeFrameCodec::encodeCommand(command)) {
        queue.receive(frame.data(), frame.size());
    }
}

TapeBackendCommand makeText(std::string text) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::InputString;
    command.text = std::move(text);
    return command;
}

} // namespace

TEST(TapeCommandQueue, DecodesInArrivalOrder) {
    TapeCommandQueue queue;
    std::vector<uint8_t> bytes{'r', 1, 0, 50, 'e', 'b', 0, 16, 'e', 'e', 'd', 'm', 0, 1, 0, 4};
    queue.receive(bytes.data(), bytes.size());
    EXPECT_EQ(queue.getSize(), 7u);

    RecordingListener listener;
    EXPECT_FALSE(queue.dispatchAll(listener));
    EXPECT_EQ(listener.calls,
              (std::vector<std::string>{"register 1 50", "step", "break 16", "step", "step",
                                        "dump", "memory 1 4"}));
    EXPECT_TRUE(queue.isEmpty());
}

TEST(TapeCommandQueue, HoldsPartialFrames) {
    TapeCommandQueue queue;
    std::vector<uint8_t> bytes{'n', 0, 8, 3, 1, 2, 3};
    for (size_t i = 0; i < bytes.size(); ++i) {
        queue.receive(&bytes[i], 1);
        if (i + 1 < bytes.size()) {
            EXPECT_TRUE(queue.isEmpty());
            EXPECT_EQ(queue.getPartialSize(), i + 1);
        }
    }
    EXPECT_EQ(queue.getSize(), 1u);
    EXPECT_EQ(queue.getPartialSize(), 0u);

    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls, (std::vector<std::string>{"poke 8 3"}));
}

TEST(TapeCommandQueue, DecodeErrorsKeepTheirPlace) {
    TapeCommandQueue queue;
    std::vector<uint8_t> bytes{'e', 'X', 'Y', 'e', 'i', 0xff, 'd'};
    queue.receive(bytes.data(), bytes.size());

    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls,
              (std::vector<std::string>{"step", "error DecodeError", "step", "error DecodeError",
                                        "dump"}));
}

TEST(TapeCommandQueue, JoinsInputStringChunks) {
    TapeCommandQueue queue;
    std::string text(600, 'z');
    text[0] = 'a';
    text[599] = 'b';
    receiveCommand(queue, makeText(text));
    queue.step();

    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls, (std::vector<std::string>{"string 600", "step"}));
    EXPECT_EQ(listener.lastText, text);
}

TEST(TapeCommandQueue, ExactChunkWaitsForNextFrame) {
    TapeCommandQueue queue;
    receiveCommand(queue, makeText(std::string(255, 'k')));
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_TRUE(queue.hasPendingText());

    std::vector<uint8_t> step{'e'};
    queue.receive(step.data(), step.size());
    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls, (std::vector<std::string>{"string 255", "step"}));
}

TEST(TapeCommandQueue, FlushCompletesPendingText) {
    TapeCommandQueue queue;
    receiveCommand(queue, makeText(std::string(510, 'k')));
    EXPECT_TRUE(queue.hasPendingText());
    queue.flushPendingText();
    EXPECT_FALSE(queue.hasPendingText());

    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls, (std::vector<std::string>{"string 510"}));
}

TEST(TapeCommandQueue, InputLimitRejectsLongStrings) {
    TapeCommandQueue queue(300);
    receiveCommand(queue, makeText(std::string(400, 'k')));
    receiveCommand(queue, makeText("ok"));

    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls, (std::vector<std::string>{"error DecodeError", "string 2"}));
}

TEST(TapeCommandQueue, StopDiscardsRemainder) {
    TapeCommandQueue queue;
    queue.step();
    queue.stop();
    queue.step();
    queue.requestDump();

    RecordingListener listener;
    EXPECT_TRUE(queue.dispatchAll(listener));
    EXPECT_EQ(listener.calls, (std::vector<std::string>{"step", "stop"}));
    EXPECT_TRUE(queue.isEmpty());

    queue.step();
    EXPECT_TRUE(queue.dispatchAll(listener));
    EXPECT_EQ(listener.calls.size(), 2u);
}

TEST(TapeCommandQueue, TypedHelpers) {
    TapeCommandQueue queue;
    queue.setBreakpoint(5);
    queue.clearBreakpoint(5);
    queue.stepIgnoringBreakpoints();
    queue.inputKey('y');
    queue.inputString("abc");
    queue.requestMemory(0, 2);
    queue.requestStack();
    queue.setMemory(9, {1, 2});
    queue.setRegister(TAPE_REG_PC, 7);

    RecordingListener listener;
    queue.dispatchAll(listener);
    EXPECT_EQ(listener.calls,
              (std::vector<std::string>{"break 5", "clear 5", "step_ignore", "key y", "string 3",
                                        "memory 0 2", "stack", "poke 9 2", "register 7 7"}));
}
