#include "tape_inspector.hpp"

#include "core/tape_device.hpp"

#include "fmt/format.h"
#include "nlohmann/json.hpp"

namespace {

TapeBackendError makeError(TapeBackendError::Kind kind, std::string message) {
    return TapeBackendError{kind, std::move(message)};
}

} // namespace

TapeStateInspector::TapeStateInspector(TapeDevice &device) : device_(device) {}

TapeDeviceSnapshot TapeStateInspector::dump() const {
    const TapeMachine &machine = device_.getMachine();
    TapeDeviceSnapshot snapshot;
    snapshot.pc = machine.pc;
    snapshot.acc = machine.acc;
    snapshot.sp = machine.sp;
    snapshot.fp = machine.fp;
    for (unsigned i = 0; i < TAPE_DATA_REG_COUNT; ++i) {
        snapshot.dataReg[i] = machine.data_reg[i];
    }
    for (unsigned i = 0; i < TAPE_ADDR_REG_COUNT; ++i) {
        snapshot.addrReg[i] = machine.addr_reg[i];
    }
    snapshot.overflowed = machine.overflowed;
    return snapshot;
}

std::string TapeStateInspector::toJSON(const TapeDeviceSnapshot &snapshot) {
    nlohmann::ordered_json json;
    json["pc"] = snapshot.pc;
    json["acc"] = snapshot.acc;
    json["sp"] = snapshot.sp;
    json["fp"] = snapshot.fp;
    auto dataRegs = nlohmann::ordered_json::array();
    for (unsigned i = 0; i < TAPE_DATA_REG_COUNT; ++i) {
        dataRegs.push_back(snapshot.dataReg[i]);
    }
    json["data_reg"] = std::move(dataRegs);
    auto addrRegs = nlohmann::ordered_json::array();
    for (unsigned i = 0; i < TAPE_ADDR_REG_COUNT; ++i) {
        addrRegs.push_back(snapshot.addrReg[i]);
    }
    json["addr_reg"] = std::move(addrRegs);
    json["overflowed"] = snapshot.overflowed;
    return json.dump();
}

auto TapeStateInspector::readMemory(std::vector<uint8_t> &out, uint16_t from, uint16_t to) const
    -> Error {
    if (from > to) {
        return makeError(TapeBackendError::ProtocolViolation,
                         fmt::format("memory range ${:04x}-${:04x} is reversed", from, to));
    }
    if (to > device_.getMemorySize()) {
        return makeError(TapeBackendError::AddressOutOfRange,
                         fmt::format("memory range ${:04x}-${:04x} exceeds {} bytes", from, to,
                                     device_.getMemorySize()));
    }
    std::vector<uint8_t> data(to - from);
    if (!data.empty() && !device_.readDataFromMemory(data.data(), from, (unsigned)data.size())) {
        return makeError(TapeBackendError::AddressOutOfRange,
                         fmt::format("memory range ${:04x}-${:04x} is not readable", from, to));
    }
    out = std::move(data);
    return std::nullopt;
}

auto TapeStateInspector::readStack(std::vector<uint8_t> &out) const -> Error {
    TapeStackRange range = device_.getStackRange();
    if (range.begin > range.end || range.end > device_.getMemorySize()) {
        return makeError(TapeBackendError::AddressOutOfRange,
                         fmt::format("stack range ${:04x}-${:04x} is outside of memory",
                                     range.begin, range.end));
    }
    std::vector<uint8_t> data(range.end - range.begin);
    if (!data.empty() &&
        !device_.readDataFromMemory(data.data(), range.begin, (unsigned)data.size())) {
        return makeError(TapeBackendError::AddressOutOfRange,
                         fmt::format("stack range ${:04x}-${:04x} is not readable", range.begin,
                                     range.end));
    }
    out = std::move(data);
    return std::nullopt;
}

auto TapeStateInspector::writeMemory(uint16_t address, const std::vector<uint8_t> &bytes)
    -> Error {
    size_t end = (size_t)address + bytes.size();
    if (end > device_.getMemorySize()) {
        return makeError(TapeBackendError::AddressOutOfRange,
                         fmt::format("write of {} byte(s) at ${:04x} exceeds {} bytes",
                                     bytes.size(), address, device_.getMemorySize()));
    }
    if (bytes.empty())
        return std::nullopt;
    if (!device_.writeDataToMemory(bytes.data(), address, (unsigned)bytes.size())) {
        return makeError(TapeBackendError::AddressOutOfRange,
                         fmt::format("write of {} byte(s) at ${:04x} was refused", bytes.size(),
                                     address));
    }
    return std::nullopt;
}

auto TapeStateInspector::writeRegister(uint8_t registerId, uint16_t value) -> Error {
    TapeMachine &machine = device_.getMachine();
    uint16_t limit;
    if (registerId <= TAPE_REG_D3) {
        limit = 0xff;
    } else if (registerId == TAPE_REG_OVERFLOW) {
        limit = 1;
    } else if (registerId < TAPE_REG_COUNT) {
        limit = 0xffff;
    } else {
        return makeError(TapeBackendError::ProtocolViolation,
                         fmt::format("unknown register id {}", registerId));
    }
    if (value > limit) {
        return makeError(TapeBackendError::ProtocolViolation,
                         fmt::format("value {} does not fit register {} (max {})", value,
                                     registerId, limit));
    }

    switch (registerId) {
    case TAPE_REG_ACC:
        machine.acc = (uint8_t)value;
        break;
    case TAPE_REG_D0:
    case TAPE_REG_D1:
    case TAPE_REG_D2:
    case TAPE_REG_D3:
        machine.data_reg[registerId - TAPE_REG_D0] = (uint8_t)value;
        break;
    case TAPE_REG_A0:
    case TAPE_REG_A1:
        machine.addr_reg[registerId - TAPE_REG_A0] = value;
        break;
    case TAPE_REG_PC:
        machine.pc = value;
        break;
    case TAPE_REG_SP:
        machine.sp = value;
        break;
    case TAPE_REG_FP:
        machine.fp = value;
        break;
    case TAPE_REG_OVERFLOW:
        machine.overflowed = value != 0;
        break;
    }
    return std::nullopt;
}
