#ifndef TAPE_TEST_DEVICE_HPP
#define TAPE_TEST_DEVICE_HPP

#include "core/tape_device.hpp"
#include "tape_host_shared.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

//  A tiny scriptable machine for exercising the protocol.  Programs are raw
//  bytes loaded at address 0; sp starts at the top of memory and the stack is
//  [sp, memory size).
//
class TapeTestDevice : public TapeDevice {
  public:
    enum Opcode : uint8_t {
        kNop = 0x00,
        kIncD0 = 0x01,  // d0 += 1, sets overflow on wrap
        kOutD0 = 0x02,  // prints "d0=<value>"
        kReadKey = 0x03,  // acc = key
        kReadString = 0x04,  // prints the string back
        kErrOut = 0x05,  // prints "fault" to the error stream
        kPushD0 = 0x06,
        kOutLong = 0x07,  // prints kLongOutputSize 'x' characters
        kEnd = 0xff,
        kCrash = 0xfe
    };
    static constexpr size_t kLongOutputSize = 600;

    explicit TapeTestDevice(unsigned memorySize = 256) : memory_(memorySize, kNop) {
        std::memset(&machine_, 0, sizeof(machine_));
        machine_.sp = (uint16_t)(memorySize > 0xffff ? 0xffff : memorySize);
    }

    void load(const std::vector<uint8_t> &program, uint16_t address = 0) {
        std::copy(program.begin(), program.end(), memory_.begin() + address);
    }

    unsigned getStepCount() const { return stepCount_; }
    const std::vector<uint8_t> &getMemory() const { return memory_; }

    void setListener(TapeDeviceListener *listener) override { listener_ = listener; }
    TapeMachine &getMachine() override { return machine_; }
    const TapeMachine &getMachine() const override { return machine_; }
    unsigned getMemorySize() const override { return (unsigned)memory_.size(); }

    bool readDataFromMemory(uint8_t *data, unsigned address, unsigned length) const override {
        if ((size_t)address + length > memory_.size())
            return false;
        std::memcpy(data, memory_.data() + address, length);
        return true;
    }

    bool writeDataToMemory(const uint8_t *data, unsigned address, unsigned length) override {
        if ((size_t)address + length > memory_.size())
            return false;
        std::memcpy(memory_.data() + address, data, length);
        return true;
    }

    TapeStackRange getStackRange() const override {
        return TapeStackRange{machine_.sp, (uint32_t)memory_.size()};
    }

    StepResult step() override {
        if (machine_.pc >= memory_.size())
            return StepResult::Crashed;
        ++stepCount_;
        switch (memory_[machine_.pc]) {
        case kNop:
            break;
        case kIncD0:
            machine_.data_reg[0]++;
            machine_.overflowed = machine_.data_reg[0] == 0;
            break;
        case kOutD0:
            output("d0=" + std::to_string(machine_.data_reg[0]));
            break;
        case kReadKey:
            return StepResult::AwaitingKey;
        case kReadString:
            return StepResult::AwaitingString;
        case kErrOut:
            if (listener_)
                listener_->onTapeDeviceErrorOutput("fault");
            break;
        case kPushD0:
            if (machine_.sp == 0)
                return StepResult::Crashed;
            memory_[--machine_.sp] = machine_.data_reg[0];
            break;
        case kOutLong:
            output(std::string(kLongOutputSize, 'x'));
            break;
        case kEnd:
            return StepResult::EndOfProgram;
        default:
            return StepResult::Crashed;
        }
        machine_.pc++;
        return StepResult::Ok;
    }

    StepResult provideKey(uint8_t key) override {
        if (memory_[machine_.pc] != kReadKey)
            return StepResult::Crashed;
        machine_.acc = key;
        machine_.pc++;
        return StepResult::Ok;
    }

    StepResult provideString(const std::string &text) override {
        if (memory_[machine_.pc] != kReadString)
            return StepResult::Crashed;
        output(text);
        machine_.pc++;
        return StepResult::Ok;
    }

  private:
    void output(const std::string &text) {
        if (listener_)
            listener_->onTapeDeviceOutput(text);
    }

    TapeMachine machine_;
    std::vector<uint8_t> memory_;
    TapeDeviceListener *listener_ = nullptr;
    unsigned stepCount_ = 0;
};

class TapeEventRecorder : public TapeEventListener {
  public:
    void onTapeEvent(const TapeBackendEvent &event) override { events.push_back(event); }

    std::vector<TapeBackendEvent> events;
};

inline TapeBackendEvent makeTapeEvent(TapeBackendEvent::Type type, std::string text = {}) {
    TapeBackendEvent event;
    event.type = type;
    event.text = std::move(text);
    return event;
}

inline TapeBackendEvent makeTapeHitEvent(uint16_t address) {
    TapeBackendEvent event;
    event.type = TapeBackendEvent::BreakpointHit;
    event.address = address;
    return event;
}

#endif
