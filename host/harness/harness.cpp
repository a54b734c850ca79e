#include "harness.hpp"

#include "tape_frame_codec.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <array>
#include <istream>
#include <iterator>
#include <ostream>
#include <vector>

namespace {

const std::array<const char *, TAPE_REG_COUNT> kRegisterNames = {
    "acc", "d0", "d1", "d2", "d3", "a0", "a1", "pc", "sp", "fp", "overflow"};

constexpr TapeBackendCommand::Type kScriptedCommands[] = {
    TapeBackendCommand::Step,          TapeBackendCommand::StepIgnoringBreakpoints,
    TapeBackendCommand::SetBreakpoint, TapeBackendCommand::ClearBreakpoint,
    TapeBackendCommand::RequestDump,   TapeBackendCommand::InputKey,
    TapeBackendCommand::InputString,   TapeBackendCommand::RequestMemory,
    TapeBackendCommand::RequestStack,  TapeBackendCommand::SetMemory,
    TapeBackendCommand::SetRegister,   TapeBackendCommand::Stop};

TapeBackendCommand::Type getCommandType(const std::string &name) {
    for (auto type : kScriptedCommands) {
        if (name == getTapeCommandName(type))
            return type;
    }
    return TapeBackendCommand::Undefined;
}

} // namespace

TapeWireHarness::TapeWireHarness() : frameCount_(0), failed_(false) {}

bool TapeWireHarness::parseAddress(const nlohmann::json &param, uint16_t &address) {
    if (!param.is_number_unsigned())
        return false;
    auto value = param.get<uint64_t>();
    if (value > 0xffff)
        return false;
    address = (uint16_t)value;
    return true;
}

bool TapeWireHarness::parseRegisterId(const nlohmann::json &param, uint8_t &registerId) {
    if (param.is_string()) {
        auto name = param.get<std::string>();
        for (unsigned i = 0; i < kRegisterNames.size(); ++i) {
            if (name == kRegisterNames[i]) {
                registerId = (uint8_t)i;
                return true;
            }
        }
        return false;
    }
    if (!param.is_number_unsigned() || param.get<uint64_t>() > 0xff)
        return false;
    registerId = param.get<uint8_t>();
    return true;
}

std::optional<TapeBackendCommand> TapeWireHarness::parseCommand(const nlohmann::json &command) {
    if (!command.is_object())
        return std::nullopt;
    auto action = command.find("act");
    if (action == command.end() || !action->is_string())
        return std::nullopt;
    auto paramIt = command.find("param");
    auto params = (paramIt != command.end()) ? *paramIt : nlohmann::json();

    TapeBackendCommand result;
    result.type = getCommandType(action->get<std::string>());
    switch (result.type) {
    case TapeBackendCommand::Undefined:
        return std::nullopt;
    case TapeBackendCommand::Step:
    case TapeBackendCommand::StepIgnoringBreakpoints:
    case TapeBackendCommand::RequestDump:
    case TapeBackendCommand::RequestStack:
    case TapeBackendCommand::Stop:
        break;
    case TapeBackendCommand::SetBreakpoint:
    case TapeBackendCommand::ClearBreakpoint:
        if (!parseAddress(params, result.address))
            return std::nullopt;
        break;
    case TapeBackendCommand::InputKey:
        if (params.is_string()) {
            auto key = params.get<std::string>();
            if (key.size() != 1)
                return std::nullopt;
            result.key = (uint8_t)key[0];
        } else if (params.is_number_unsigned() && params.get<uint64_t>() <= 0xff) {
            result.key = params.get<uint8_t>();
        } else {
            return std::nullopt;
        }
        if (!TapeFrameCodec::isSupportedKey(result.key))
            return std::nullopt;
        break;
    case TapeBackendCommand::InputString:
        if (!params.is_string())
            return std::nullopt;
        result.text = params.get<std::string>();
        break;
    case TapeBackendCommand::RequestMemory:
        if (!params.is_object() || !params.contains("from") || !params.contains("to"))
            return std::nullopt;
        if (!parseAddress(params["from"], result.address) ||
            !parseAddress(params["to"], result.addressEnd))
            return std::nullopt;
        break;
    case TapeBackendCommand::SetMemory:
        if (!params.is_object() || !params.contains("address") || !params.contains("bytes"))
            return std::nullopt;
        if (!parseAddress(params["address"], result.address) || !params["bytes"].is_array())
            return std::nullopt;
        for (auto &byte : params["bytes"]) {
            if (!byte.is_number_unsigned() || byte.get<uint64_t>() > 0xff)
                return std::nullopt;
            result.bytes.push_back(byte.get<uint8_t>());
        }
        break;
    case TapeBackendCommand::SetRegister:
        if (!params.is_object() || !params.contains("id") || !params.contains("value"))
            return std::nullopt;
        if (!parseRegisterId(params["id"], result.registerId) ||
            !parseAddress(params["value"], result.value))
            return std::nullopt;
        break;
    }
    return result;
}

bool TapeWireHarness::run(const nlohmann::json &command, std::ostream &output) {
    auto parsed = parseCommand(command);
    if (!parsed.has_value()) {
        spdlog::warn("Command syntax not valid: {}", command.dump());
        failed_ = true;
        return false;
    }
    for (auto &frame : TapeFrameCodec::encodeCommand(*parsed)) {
        output.write(reinterpret_cast<const char *>(frame.data()), (std::streamsize)frame.size());
        ++frameCount_;
    }
    spdlog::debug("{} encoded", getTapeCommandName(parsed->type));
    if (!output.good()) {
        spdlog::error("Unable to write frames");
        failed_ = true;
        return false;
    }
    return true;
}

nlohmann::ordered_json TapeWireHarness::describeEvent(const TapeBackendEvent &event) {
    nlohmann::ordered_json json;
    json["event"] = getTapeEventName(event.type);
    switch (event.type) {
    case TapeBackendEvent::Output:
    case TapeBackendEvent::ErrorOutput:
    case TapeBackendEvent::DumpResult:
        json["text"] = event.text;
        break;
    case TapeBackendEvent::MemoryResult:
    case TapeBackendEvent::StackResult:
        json["bytes"] = event.data;
        break;
    case TapeBackendEvent::BreakpointHit:
        json["address"] = event.address;
        break;
    default:
        break;
    }
    return json;
}

void TapeWireHarness::printEvent(const TapeBackendEvent &event, std::ostream &output) {
    output << describeEvent(event).dump(-1, ' ', false,
                                        nlohmann::ordered_json::error_handler_t::replace)
           << "\n";
}

bool TapeWireHarness::decode(std::istream &input, std::ostream &output) {
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(input)),
                               std::istreambuf_iterator<char>());
    TapeEventAssembler assembler;
    std::vector<TapeBackendEvent> events;
    size_t offset = 0;
    while (offset < bytes.size()) {
        auto result = TapeFrameCodec::decodeEvent(bytes.data() + offset, bytes.size() - offset);
        if (result.status == TapeFrameCodec::DecodeStatus::NeedMore) {
            spdlog::warn("Incomplete frame of {} byte(s) at offset {}", bytes.size() - offset,
                         offset);
            failed_ = true;
            break;
        }
        if (result.status == TapeFrameCodec::DecodeStatus::Error) {
            spdlog::warn("Offset {}: {}", offset, result.error.message);
            failed_ = true;
        } else {
            ++frameCount_;
            assembler.push(result.value, events);
        }
        offset += result.consumed;
        for (auto &event : events) {
            printEvent(event, output);
        }
        events.clear();
    }
    assembler.flush(events);
    for (auto &event : events) {
        printEvent(event, output);
    }
    return !failed_;
}
