#include "tape_backend.hpp"

#include "spdlog/common.h"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace {

const char *getStateName(TapeBackend::State state) {
    switch (state) {
    case TapeBackend::State::Idle:
        return "idle";
    case TapeBackend::State::Suspended:
        return "suspended";
    case TapeBackend::State::Finished:
        return "finished";
    case TapeBackend::State::Stopped:
        return "stopped";
    }
    return "unknown";
}

} // namespace

template <typename... Args>
void TapeBackend::localLog(int logLevel, fmt::format_string<Args...> msg, Args &&...args) {
    static const spdlog::level::level_enum kLevels[] = {spdlog::level::debug, spdlog::level::info,
                                                        spdlog::level::warn, spdlog::level::err,
                                                        spdlog::level::critical};
    auto level = kLevels[std::clamp(logLevel, TAPE_DEBUG_LOG_DEBUG, TAPE_DEBUG_LOG_FATAL)];
    spdlog::log(level, "[tape] {}", fmt::format(msg, std::forward<Args>(args)...));
}

TapeBackend::TapeBackend(TapeDevice &device, TapeEventListener &events, const Config &config)
    : config_(config), device_(device), events_(events), inspector_(device), bridge_(*this),
      state_(State::Idle), stepCount_(0) {
    device_.setListener(&bridge_);
    localLog(TAPE_DEBUG_LOG_INFO, "Session started at pc ${:04x}", device_.getMachine().pc);
}

TapeBackend::~TapeBackend() { device_.setListener(nullptr); }

bool TapeBackend::step(TapeCommandQueue &commands) {
    bool halted = commands.dispatchAll(*this);
    return halted || isTerminated();
}

bool TapeBackend::isCommandQueueHalted() const { return isTerminated(); }

void TapeBackend::onTapeEvent(const TapeBackendEvent &event) {
    if (config_.traceEnabled) {
        switch (event.type) {
        case TapeBackendEvent::BreakpointHit:
            localLog(TAPE_DEBUG_LOG_DEBUG, "<- {} ${:04x}", getTapeEventName(event.type),
                     event.address);
            break;
        case TapeBackendEvent::MemoryResult:
        case TapeBackendEvent::StackResult:
            localLog(TAPE_DEBUG_LOG_DEBUG, "<- {} {} byte(s)", getTapeEventName(event.type),
                     event.data.size());
            break;
        default:
            localLog(TAPE_DEBUG_LOG_DEBUG, "<- {} '{}'", getTapeEventName(event.type),
                     event.text);
            break;
        }
    }
    events_.onTapeEvent(event);
}

void TapeBackend::emit(TapeBackendEvent::Type type) {
    TapeBackendEvent event;
    event.type = type;
    onTapeEvent(event);
}

void TapeBackend::reportError(const TapeBackendError &error) {
    localLog(TAPE_DEBUG_LOG_WARN, "{}: {}", getTapeErrorKindName(error.kind), error.message);
    bridge_.emitText(TapeBackendEvent::ErrorOutput,
                     fmt::format("{}: {}", getTapeErrorKindName(error.kind), error.message));
}

void TapeBackend::handleStepResult(TapeDevice::StepResult result) {
    switch (result) {
    case TapeDevice::StepResult::Ok:
        break;
    case TapeDevice::StepResult::AwaitingKey:
        state_ = State::Suspended;
        bridge_.request(TapePendingInput::AwaitingKey);
        break;
    case TapeDevice::StepResult::AwaitingString:
        state_ = State::Suspended;
        bridge_.request(TapePendingInput::AwaitingString);
        break;
    case TapeDevice::StepResult::EndOfProgram:
        emit(TapeBackendEvent::EndOfProgram);
        state_ = State::Finished;
        localLog(TAPE_DEBUG_LOG_INFO, "Program ended after {} instruction(s)", stepCount_);
        break;
    case TapeDevice::StepResult::Crashed:
        emit(TapeBackendEvent::Crashed);
        state_ = State::Finished;
        localLog(TAPE_DEBUG_LOG_WARN, "{}: program faulted at pc ${:04x}",
                 getTapeErrorKindName(TapeBackendError::DeviceCrash), device_.getMachine().pc);
        break;
    }
}

void TapeBackend::onCommandStep(bool ignoreBreakpoints) {
    const char *name = getTapeCommandName(ignoreBreakpoints
                                              ? TapeBackendCommand::StepIgnoringBreakpoints
                                              : TapeBackendCommand::Step);
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {} at ${:04x}", name, device_.getMachine().pc);
    }
    if (state_ == State::Suspended) {
        reportError(TapeBackendError{
            TapeBackendError::ProtocolViolation,
            fmt::format("{} rejected while awaiting {} input", name,
                        getTapePendingInputName(bridge_.getPending()))});
        return;
    }
    uint16_t pc = device_.getMachine().pc;
    if (!ignoreBreakpoints && breakpoints_.contains(pc)) {
        TapeBackendEvent event;
        event.type = TapeBackendEvent::BreakpointHit;
        event.address = pc;
        onTapeEvent(event);
        return;
    }
    ++stepCount_;
    handleStepResult(device_.step());
}

void TapeBackend::onCommandSetBreakpoint(uint16_t address) {
    if (breakpoints_.set(address) || config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "Breakpoint set at ${:04x}", address);
    }
}

void TapeBackend::onCommandClearBreakpoint(uint16_t address) {
    if (breakpoints_.clear(address) || config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "Breakpoint cleared at ${:04x}", address);
    }
}

void TapeBackend::onCommandRequestDump() {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {}", getTapeCommandName(TapeBackendCommand::RequestDump));
    }
    bridge_.emitText(TapeBackendEvent::DumpResult,
                     TapeStateInspector::toJSON(inspector_.dump()));
}

void TapeBackend::onCommandInputKey(uint8_t key) {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {} 0x{:02x}",
                 getTapeCommandName(TapeBackendCommand::InputKey), key);
    }
    if (auto error = bridge_.resolve(TapePendingInput::AwaitingKey); error.has_value()) {
        reportError(*error);
        return;
    }
    state_ = State::Idle;
    handleStepResult(device_.provideKey(key));
}

void TapeBackend::onCommandInputString(const std::string &text) {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {} '{}'",
                 getTapeCommandName(TapeBackendCommand::InputString), text);
    }
    if (auto error = bridge_.resolve(TapePendingInput::AwaitingString); error.has_value()) {
        reportError(*error);
        return;
    }
    state_ = State::Idle;
    handleStepResult(device_.provideString(text));
}

void TapeBackend::onCommandRequestMemory(uint16_t from, uint16_t to) {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {} ${:04x}-${:04x}",
                 getTapeCommandName(TapeBackendCommand::RequestMemory), from, to);
    }
    TapeBackendEvent event;
    event.type = TapeBackendEvent::MemoryResult;
    if (auto error = inspector_.readMemory(event.data, from, to); error.has_value()) {
        reportError(*error);
        return;
    }
    onTapeEvent(event);
}

void TapeBackend::onCommandRequestStack() {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {}",
                 getTapeCommandName(TapeBackendCommand::RequestStack));
    }
    TapeBackendEvent event;
    event.type = TapeBackendEvent::StackResult;
    if (auto error = inspector_.readStack(event.data); error.has_value()) {
        reportError(*error);
        return;
    }
    onTapeEvent(event);
}

void TapeBackend::onCommandSetMemory(uint16_t address, const std::vector<uint8_t> &bytes) {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {} ${:04x} {} byte(s)",
                 getTapeCommandName(TapeBackendCommand::SetMemory), address, bytes.size());
    }
    if (auto error = inspector_.writeMemory(address, bytes); error.has_value()) {
        reportError(*error);
    }
}

void TapeBackend::onCommandSetRegister(uint8_t registerId, uint16_t value) {
    if (config_.traceEnabled) {
        localLog(TAPE_DEBUG_LOG_DEBUG, "-> {} {}={}",
                 getTapeCommandName(TapeBackendCommand::SetRegister), registerId, value);
    }
    if (auto error = inspector_.writeRegister(registerId, value); error.has_value()) {
        reportError(*error);
    }
}

void TapeBackend::onCommandStop() {
    localLog(TAPE_DEBUG_LOG_INFO, "Session stopped while {} after {} instruction(s)",
             getStateName(state_), stepCount_);
    state_ = State::Stopped;
}

void TapeBackend::onCommandDecodeError(const TapeBackendError &error) { reportError(error); }
