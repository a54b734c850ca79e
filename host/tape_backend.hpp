#ifndef TAPE_HOST_BACKEND_HPP
#define TAPE_HOST_BACKEND_HPP

#include "core/tape_device.hpp"
#include "tape_breakpoints.hpp"
#include "tape_command_queue.hpp"
#include "tape_inspector.hpp"
#include "tape_io_bridge.hpp"

#include "fmt/format.h"

#include <string>
#include <vector>

struct TapeBackendConfig {
    //  log every command and event at debug level
    bool traceEnabled;
};

//  TapeBackend is the execution controller for one debugging session.
//      - Commands arrive in order from a TapeCommandQueue and are applied
//        before the next one is looked at.
//      - Instructions only execute on Step/StepIgnoringBreakpoints.  A plain
//        Step at a breakpoint reports the hit instead of executing.
//      - A program blocked on input suspends the session until the matching
//        input command arrives.  Steps received while suspended are rejected.
//      - Stop, end of program and a device crash are terminal.  Nothing is
//        processed afterwards.
//
class TapeBackend : public TapeCommandQueueListener, TapeEventListener {
  public:
    using Config = TapeBackendConfig;

    enum class State { Idle, Suspended, Finished, Stopped };

    TapeBackend(TapeDevice &device, TapeEventListener &events, const Config &config);
    virtual ~TapeBackend();

    //  Applies every queued command.  Returns true once the session has ended.
    bool step(TapeCommandQueue &commands);

    State getState() const { return state_; }
    bool isTerminated() const { return state_ == State::Finished || state_ == State::Stopped; }
    TapePendingInput getPendingInput() const { return bridge_.getPending(); }
    const TapeBreakpoints &getBreakpoints() const { return breakpoints_; }

  private:
    //  TapeCommandQueueListener
    void onCommandStep(bool ignoreBreakpoints) final;
    void onCommandSetBreakpoint(uint16_t address) final;
    void onCommandClearBreakpoint(uint16_t address) final;
    void onCommandRequestDump() final;
    void onCommandInputKey(uint8_t key) final;
    void onCommandInputString(const std::string &text) final;
    void onCommandRequestMemory(uint16_t from, uint16_t to) final;
    void onCommandRequestStack() final;
    void onCommandSetMemory(uint16_t address, const std::vector<uint8_t> &bytes) final;
    void onCommandSetRegister(uint8_t registerId, uint16_t value) final;
    void onCommandStop() final;
    void onCommandDecodeError(const TapeBackendError &error) final;
    bool isCommandQueueHalted() const final;

    //  TapeEventListener
    void onTapeEvent(const TapeBackendEvent &event) final;

    //  internal
    void handleStepResult(TapeDevice::StepResult result);
    void reportError(const TapeBackendError &error);
    void emit(TapeBackendEvent::Type type);
    template <typename... Args>
    void localLog(int logLevel, fmt::format_string<Args...> msg, Args &&...args);

  private:
    Config config_;
    TapeDevice &device_;
    TapeEventListener &events_;

    TapeBreakpoints breakpoints_;
    TapeStateInspector inspector_;
    TapeIOBridge bridge_;

    State state_;
    unsigned stepCount_;
};

#endif
