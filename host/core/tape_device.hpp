#ifndef TAPE_HOST_DEVICE_HPP
#define TAPE_HOST_DEVICE_HPP

#include "tape_types.h"

#include <string>
#include <string_view>

class TapeDeviceListener;

//  TapeDevice is the virtual machine driven by the debug protocol.  The
//  protocol never interprets instructions itself; it asks the device to
//  execute exactly one and reads back the resulting state.
//
//  - step() executes the instruction at pc.  If that instruction needs a key
//    or a string from the user, it returns AwaitingKey/AwaitingString and
//    does not complete until provideKey()/provideString() is called.
//  - Output produced while executing is pushed to the listener before the
//    call returns.
//
class TapeDevice {
  public:
    enum class StepResult { Ok, AwaitingKey, AwaitingString, EndOfProgram, Crashed };

    virtual ~TapeDevice() = default;

    virtual void setListener(TapeDeviceListener *listener) = 0;

    //  Direct access to the register file
    virtual TapeMachine &getMachine() = 0;
    virtual const TapeMachine &getMachine() const = 0;

    //  Size of the addressable memory in bytes
    virtual unsigned getMemorySize() const = 0;
    //  Byte access to memory.  Both fail without side effects if the range
    //  does not fit inside getMemorySize().
    virtual bool readDataFromMemory(uint8_t *data, unsigned address, unsigned length) const = 0;
    virtual bool writeDataToMemory(const uint8_t *data, unsigned address, unsigned length) = 0;
    //  The stack region as the device defines it from its own sp/fp
    virtual TapeStackRange getStackRange() const = 0;

    virtual StepResult step() = 0;
    virtual StepResult provideKey(uint8_t key) = 0;
    virtual StepResult provideString(const std::string &text) = 0;
};

class TapeDeviceListener {
  public:
    virtual ~TapeDeviceListener() = default;

    virtual void onTapeDeviceOutput(std::string_view text) = 0;
    virtual void onTapeDeviceErrorOutput(std::string_view text) = 0;
};

#endif
