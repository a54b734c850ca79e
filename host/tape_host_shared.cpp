#include "tape_host_shared.hpp"

const char *getTapeErrorKindName(TapeBackendError::Kind kind) {
    switch (kind) {
    case TapeBackendError::DecodeError:
        return "DecodeError";
    case TapeBackendError::ProtocolViolation:
        return "ProtocolViolation";
    case TapeBackendError::AddressOutOfRange:
        return "AddressOutOfRange";
    case TapeBackendError::DeviceCrash:
        return "DeviceCrash";
    }
    return "Unknown";
}

const char *getTapeCommandName(TapeBackendCommand::Type type) {
    switch (type) {
    case TapeBackendCommand::Undefined:
        return "undefined";
    case TapeBackendCommand::Step:
        return "step";
    case TapeBackendCommand::StepIgnoringBreakpoints:
        return "step_ignore";
    case TapeBackendCommand::SetBreakpoint:
        return "break";
    case TapeBackendCommand::ClearBreakpoint:
        return "clear";
    case TapeBackendCommand::RequestDump:
        return "dump";
    case TapeBackendCommand::InputKey:
        return "key";
    case TapeBackendCommand::InputString:
        return "string";
    case TapeBackendCommand::RequestMemory:
        return "memory";
    case TapeBackendCommand::RequestStack:
        return "stack";
    case TapeBackendCommand::SetMemory:
        return "poke";
    case TapeBackendCommand::SetRegister:
        return "register";
    case TapeBackendCommand::Stop:
        return "stop";
    }
    return "unknown";
}

const char *getTapeEventName(TapeBackendEvent::Type type) {
    switch (type) {
    case TapeBackendEvent::Undefined:
        return "undefined";
    case TapeBackendEvent::Output:
        return "output";
    case TapeBackendEvent::ErrorOutput:
        return "error";
    case TapeBackendEvent::BreakpointHit:
        return "breakpoint";
    case TapeBackendEvent::DumpResult:
        return "dump";
    case TapeBackendEvent::MemoryResult:
        return "memory";
    case TapeBackendEvent::StackResult:
        return "stack";
    case TapeBackendEvent::KeyRequested:
        return "key_requested";
    case TapeBackendEvent::StringRequested:
        return "string_requested";
    case TapeBackendEvent::EndOfProgram:
        return "end";
    case TapeBackendEvent::Crashed:
        return "crashed";
    }
    return "unknown";
}

const char *getTapePendingInputName(TapePendingInput pending) {
    switch (pending) {
    case TapePendingInput::None:
        return "none";
    case TapePendingInput::AwaitingKey:
        return "key";
    case TapePendingInput::AwaitingString:
        return "string";
    }
    return "unknown";
}
