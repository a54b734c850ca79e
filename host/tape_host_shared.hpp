#ifndef TAPE_HOST_SHARED_HPP
#define TAPE_HOST_SHARED_HPP

#include "tape_types.h"

#include <cstdint>
#include <string>
#include <vector>

struct TapeBackendCommand {
    enum Type {
        Undefined,
        Step,
        StepIgnoringBreakpoints,
        SetBreakpoint,
        ClearBreakpoint,
        RequestDump,
        InputKey,
        InputString,
        RequestMemory,
        RequestStack,
        SetMemory,
        SetRegister,
        Stop
    };
    Type type = Undefined;
    //  SetBreakpoint, ClearBreakpoint, SetMemory and the start of RequestMemory
    uint16_t address = 0;
    //  end of RequestMemory (exclusive)
    uint16_t addressEnd = 0;
    uint8_t registerId = 0;
    uint16_t value = 0;
    uint8_t key = 0;
    std::string text;
    std::vector<uint8_t> bytes;

    bool operator==(const TapeBackendCommand &other) const {
        return type == other.type && address == other.address &&
               addressEnd == other.addressEnd && registerId == other.registerId &&
               value == other.value && key == other.key && text == other.text &&
               bytes == other.bytes;
    }
    bool operator!=(const TapeBackendCommand &other) const { return !(*this == other); }
};

struct TapeBackendEvent {
    enum Type {
        Undefined,
        Output,
        ErrorOutput,
        BreakpointHit,
        DumpResult,
        MemoryResult,
        StackResult,
        KeyRequested,
        StringRequested,
        EndOfProgram,
        Crashed
    };
    Type type = Undefined;
    //  BreakpointHit
    uint16_t address = 0;
    //  Output, ErrorOutput, DumpResult
    std::string text;
    //  MemoryResult, StackResult
    std::vector<uint8_t> data;

    bool operator==(const TapeBackendEvent &other) const {
        return type == other.type && address == other.address && text == other.text &&
               data == other.data;
    }
    bool operator!=(const TapeBackendEvent &other) const { return !(*this == other); }
};

struct TapeBackendError {
    enum Kind { DecodeError, ProtocolViolation, AddressOutOfRange, DeviceCrash };
    Kind kind;
    std::string message;
};

//  Read-only projection of the machine registers taken at dump time
struct TapeDeviceSnapshot {
    uint16_t pc;
    uint8_t acc;
    uint16_t sp;
    uint16_t fp;
    uint8_t dataReg[TAPE_DATA_REG_COUNT];
    uint16_t addrReg[TAPE_ADDR_REG_COUNT];
    bool overflowed;
};

enum class TapePendingInput { None, AwaitingKey, AwaitingString };

//  Receives every event destined for the controller, in emission order
class TapeEventListener {
  public:
    virtual ~TapeEventListener() {}

    virtual void onTapeEvent(const TapeBackendEvent &event) = 0;
};

const char *getTapeErrorKindName(TapeBackendError::Kind kind);
const char *getTapeCommandName(TapeBackendCommand::Type type);
const char *getTapeEventName(TapeBackendEvent::Type type);
const char *getTapePendingInputName(TapePendingInput pending);

#endif
