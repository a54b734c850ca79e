#include "tape_frame_codec.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace {

//  inbound
constexpr uint8_t kCommandStep = 'e';
constexpr uint8_t kCommandStepIgnoringBreakpoints = 'f';
constexpr uint8_t kCommandStop = 'q';
constexpr uint8_t kCommandSetBreakpoint = 'b';
constexpr uint8_t kCommandClearBreakpoint = 'c';
constexpr uint8_t kCommandRequestDump = 'd';
constexpr uint8_t kCommandInputKey = 'i';
constexpr uint8_t kCommandInputString = 't';
constexpr uint8_t kCommandRequestMemory = 'm';
constexpr uint8_t kCommandRequestStack = 's';
constexpr uint8_t kCommandSetMemory = 'n';
constexpr uint8_t kCommandSetRegister = 'r';

//  outbound
constexpr uint8_t kEventOutput = 'o';
constexpr uint8_t kEventErrorOutput = 'e';
constexpr uint8_t kEventBreakpointHit = 'h';
constexpr uint8_t kEventDumpResult = 'd';
constexpr uint8_t kEventMemoryResult = 'm';
constexpr uint8_t kEventStackResult = 's';
constexpr uint8_t kEventKeyRequested = 'k';
constexpr uint8_t kEventStringRequested = 't';
constexpr uint8_t kEventEndOfProgram = 'f';
constexpr uint8_t kEventCrashed = 'c';

constexpr size_t kChunkLimit = TAPE_FRAME_CHUNK_LIMIT;

uint16_t readU16(const uint8_t *data) { return (uint16_t)((data[0] << 8) | data[1]); }

void appendU16(TapeFrameCodec::Frame &frame, uint16_t value) {
    frame.push_back((uint8_t)(value >> 8));
    frame.push_back((uint8_t)(value & 0xff));
}

void appendChunks(std::vector<TapeFrameCodec::Frame> &frames, uint8_t prefix, const uint8_t *data,
                  size_t size) {
    size_t offset = 0;
    do {
        size_t length = std::min(size - offset, kChunkLimit);
        TapeFrameCodec::Frame frame;
        frame.reserve(length + 2);
        frame.push_back(prefix);
        frame.push_back((uint8_t)length);
        frame.insert(frame.end(), data + offset, data + offset + length);
        frames.emplace_back(std::move(frame));
        offset += length;
    } while (offset < size);
}

void appendChunks(std::vector<TapeFrameCodec::Frame> &frames, uint8_t prefix,
                  const std::string &text) {
    appendChunks(frames, prefix, reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

//  Consumes the run of bytes that cannot start a frame
template <typename T>
TapeFrameCodec::DecodeResult<T> skipUnrecognized(const uint8_t *data, size_t size,
                                                 bool (*isPrefix)(uint8_t)) {
    TapeFrameCodec::DecodeResult<T> result;
    size_t skipped = 1;
    while (skipped < size && !isPrefix(data[skipped])) {
        ++skipped;
    }
    result.status = TapeFrameCodec::DecodeStatus::Error;
    result.consumed = skipped;
    result.error.kind = TapeBackendError::DecodeError;
    result.error.message =
        fmt::format("unrecognized prefix 0x{:02x}, {} byte(s) skipped", data[0], skipped);
    return result;
}

//  Returns the size of a <len:1><bytes:len> block at data, or 0 if incomplete
size_t lengthPrefixedSize(const uint8_t *data, size_t size) {
    if (size < 1)
        return 0;
    size_t total = 1 + data[0];
    return size >= total ? total : 0;
}

} // namespace

namespace TapeFrameCodec {

bool isCommandPrefix(uint8_t prefix) {
    switch (prefix) {
    case kCommandStep:
    case kCommandStepIgnoringBreakpoints:
    case kCommandStop:
    case kCommandSetBreakpoint:
    case kCommandClearBreakpoint:
    case kCommandRequestDump:
    case kCommandInputKey:
    case kCommandInputString:
    case kCommandRequestMemory:
    case kCommandRequestStack:
    case kCommandSetMemory:
    case kCommandSetRegister:
        return true;
    }
    return false;
}

bool isEventPrefix(uint8_t prefix) {
    switch (prefix) {
    case kEventOutput:
    case kEventErrorOutput:
    case kEventBreakpointHit:
    case kEventDumpResult:
    case kEventMemoryResult:
    case kEventStackResult:
    case kEventKeyRequested:
    case kEventStringRequested:
    case kEventEndOfProgram:
    case kEventCrashed:
        return true;
    }
    return false;
}

bool isSupportedKey(uint8_t key) {
    //  0x21-0x7e covers letters, digits and the ASCII punctuation set
    if (key >= 0x21 && key <= 0x7e)
        return true;
    switch (key) {
    case TAPE_KEY_BACKSPACE:
    case TAPE_KEY_TAB:
    case TAPE_KEY_RETURN:
    case TAPE_KEY_ESCAPE:
    case TAPE_KEY_SPACE:
        return true;
    }
    return false;
}

bool isChunkedEvent(TapeBackendEvent::Type type) {
    switch (type) {
    case TapeBackendEvent::Output:
    case TapeBackendEvent::ErrorOutput:
    case TapeBackendEvent::DumpResult:
    case TapeBackendEvent::MemoryResult:
    case TapeBackendEvent::StackResult:
        return true;
    default:
        return false;
    }
}

size_t getEventPayloadSize(const TapeBackendEvent &event) {
    switch (event.type) {
    case TapeBackendEvent::Output:
    case TapeBackendEvent::ErrorOutput:
    case TapeBackendEvent::DumpResult:
        return event.text.size();
    case TapeBackendEvent::MemoryResult:
    case TapeBackendEvent::StackResult:
        return event.data.size();
    default:
        return 0;
    }
}

DecodeResult<TapeBackendCommand> decodeCommand(const uint8_t *data, size_t size) {
    DecodeResult<TapeBackendCommand> result;
    if (size == 0)
        return result;

    TapeBackendCommand &command = result.value;
    size_t frameSize = 1;
    switch (data[0]) {
    case kCommandStep:
        command.type = TapeBackendCommand::Step;
        break;
    case kCommandStepIgnoringBreakpoints:
        command.type = TapeBackendCommand::StepIgnoringBreakpoints;
        break;
    case kCommandStop:
        command.type = TapeBackendCommand::Stop;
        break;
    case kCommandRequestDump:
        command.type = TapeBackendCommand::RequestDump;
        break;
    case kCommandRequestStack:
        command.type = TapeBackendCommand::RequestStack;
        break;
    case kCommandSetBreakpoint:
    case kCommandClearBreakpoint:
        frameSize = 3;
        if (size < frameSize)
            return result;
        command.type = data[0] == kCommandSetBreakpoint ? TapeBackendCommand::SetBreakpoint
                                                        : TapeBackendCommand::ClearBreakpoint;
        command.address = readU16(data + 1);
        break;
    case kCommandInputKey:
        frameSize = 2;
        if (size < frameSize)
            return result;
        if (!isSupportedKey(data[1])) {
            result.status = DecodeStatus::Error;
            result.consumed = frameSize;
            result.error.message = fmt::format("unsupported key value 0x{:02x}", data[1]);
            return result;
        }
        command.type = TapeBackendCommand::InputKey;
        command.key = data[1];
        break;
    case kCommandInputString: {
        size_t blockSize = lengthPrefixedSize(data + 1, size - 1);
        if (blockSize == 0)
            return result;
        frameSize = 1 + blockSize;
        command.type = TapeBackendCommand::InputString;
        command.text.assign(reinterpret_cast<const char *>(data + 2), blockSize - 1);
    } break;
    case kCommandRequestMemory:
        frameSize = 5;
        if (size < frameSize)
            return result;
        command.type = TapeBackendCommand::RequestMemory;
        command.address = readU16(data + 1);
        command.addressEnd = readU16(data + 3);
        break;
    case kCommandSetMemory: {
        if (size < 3)
            return result;
        size_t blockSize = lengthPrefixedSize(data + 3, size - 3);
        if (blockSize == 0)
            return result;
        frameSize = 3 + blockSize;
        command.type = TapeBackendCommand::SetMemory;
        command.address = readU16(data + 1);
        command.bytes.assign(data + 4, data + frameSize);
    } break;
    case kCommandSetRegister:
        frameSize = 4;
        if (size < frameSize)
            return result;
        command.type = TapeBackendCommand::SetRegister;
        command.registerId = data[1];
        command.value = readU16(data + 2);
        break;
    default:
        return skipUnrecognized<TapeBackendCommand>(data, size, &isCommandPrefix);
    }
    result.status = DecodeStatus::Ok;
    result.consumed = frameSize;
    return result;
}

DecodeResult<TapeBackendEvent> decodeEvent(const uint8_t *data, size_t size) {
    DecodeResult<TapeBackendEvent> result;
    if (size == 0)
        return result;

    TapeBackendEvent &event = result.value;
    size_t frameSize = 1;
    switch (data[0]) {
    case kEventOutput:
    case kEventErrorOutput:
    case kEventDumpResult: {
        size_t blockSize = lengthPrefixedSize(data + 1, size - 1);
        if (blockSize == 0)
            return result;
        frameSize = 1 + blockSize;
        if (data[0] == kEventOutput)
            event.type = TapeBackendEvent::Output;
        else if (data[0] == kEventErrorOutput)
            event.type = TapeBackendEvent::ErrorOutput;
        else
            event.type = TapeBackendEvent::DumpResult;
        event.text.assign(reinterpret_cast<const char *>(data + 2), blockSize - 1);
    } break;
    case kEventMemoryResult:
    case kEventStackResult: {
        size_t blockSize = lengthPrefixedSize(data + 1, size - 1);
        if (blockSize == 0)
            return result;
        frameSize = 1 + blockSize;
        event.type = data[0] == kEventMemoryResult ? TapeBackendEvent::MemoryResult
                                                   : TapeBackendEvent::StackResult;
        event.data.assign(data + 2, data + frameSize);
    } break;
    case kEventBreakpointHit:
        frameSize = 3;
        if (size < frameSize)
            return result;
        event.type = TapeBackendEvent::BreakpointHit;
        event.address = readU16(data + 1);
        break;
    case kEventKeyRequested:
        event.type = TapeBackendEvent::KeyRequested;
        break;
    case kEventStringRequested:
        event.type = TapeBackendEvent::StringRequested;
        break;
    case kEventEndOfProgram:
        event.type = TapeBackendEvent::EndOfProgram;
        break;
    case kEventCrashed:
        event.type = TapeBackendEvent::Crashed;
        break;
    default:
        return skipUnrecognized<TapeBackendEvent>(data, size, &isEventPrefix);
    }
    result.status = DecodeStatus::Ok;
    result.consumed = frameSize;
    return result;
}

std::vector<Frame> encodeCommand(const TapeBackendCommand &command) {
    std::vector<Frame> frames;
    switch (command.type) {
    case TapeBackendCommand::Undefined:
        break;
    case TapeBackendCommand::Step:
        frames.push_back({kCommandStep});
        break;
    case TapeBackendCommand::StepIgnoringBreakpoints:
        frames.push_back({kCommandStepIgnoringBreakpoints});
        break;
    case TapeBackendCommand::Stop:
        frames.push_back({kCommandStop});
        break;
    case TapeBackendCommand::RequestDump:
        frames.push_back({kCommandRequestDump});
        break;
    case TapeBackendCommand::RequestStack:
        frames.push_back({kCommandRequestStack});
        break;
    case TapeBackendCommand::SetBreakpoint:
    case TapeBackendCommand::ClearBreakpoint: {
        Frame frame{command.type == TapeBackendCommand::SetBreakpoint ? kCommandSetBreakpoint
                                                                      : kCommandClearBreakpoint};
        appendU16(frame, command.address);
        frames.emplace_back(std::move(frame));
    } break;
    case TapeBackendCommand::InputKey:
        frames.push_back({kCommandInputKey, command.key});
        break;
    case TapeBackendCommand::InputString:
        appendChunks(frames, kCommandInputString, command.text);
        break;
    case TapeBackendCommand::RequestMemory: {
        Frame frame{kCommandRequestMemory};
        appendU16(frame, command.address);
        appendU16(frame, command.addressEnd);
        frames.emplace_back(std::move(frame));
    } break;
    case TapeBackendCommand::SetMemory: {
        //  every frame carries its own address so nothing is joined on decode
        size_t offset = 0;
        do {
            size_t length = std::min(command.bytes.size() - offset, kChunkLimit);
            Frame frame{kCommandSetMemory};
            appendU16(frame, (uint16_t)(command.address + offset));
            frame.push_back((uint8_t)length);
            frame.insert(frame.end(), command.bytes.begin() + offset,
                         command.bytes.begin() + offset + length);
            frames.emplace_back(std::move(frame));
            offset += length;
        } while (offset < command.bytes.size());
    } break;
    case TapeBackendCommand::SetRegister: {
        Frame frame{kCommandSetRegister, command.registerId};
        appendU16(frame, command.value);
        frames.emplace_back(std::move(frame));
    } break;
    }
    return frames;
}

std::vector<Frame> encodeEvent(const TapeBackendEvent &event) {
    std::vector<Frame> frames;
    switch (event.type) {
    case TapeBackendEvent::Undefined:
        break;
    case TapeBackendEvent::Output:
        appendChunks(frames, kEventOutput, event.text);
        break;
    case TapeBackendEvent::ErrorOutput:
        appendChunks(frames, kEventErrorOutput, event.text);
        break;
    case TapeBackendEvent::DumpResult:
        appendChunks(frames, kEventDumpResult, event.text);
        break;
    case TapeBackendEvent::MemoryResult:
        appendChunks(frames, kEventMemoryResult, event.data.data(), event.data.size());
        break;
    case TapeBackendEvent::StackResult:
        appendChunks(frames, kEventStackResult, event.data.data(), event.data.size());
        break;
    case TapeBackendEvent::BreakpointHit: {
        Frame frame{kEventBreakpointHit};
        appendU16(frame, event.address);
        frames.emplace_back(std::move(frame));
    } break;
    case TapeBackendEvent::KeyRequested:
        frames.push_back({kEventKeyRequested});
        break;
    case TapeBackendEvent::StringRequested:
        frames.push_back({kEventStringRequested});
        break;
    case TapeBackendEvent::EndOfProgram:
        frames.push_back({kEventEndOfProgram});
        break;
    case TapeBackendEvent::Crashed:
        frames.push_back({kEventCrashed});
        break;
    }
    return frames;
}

} // namespace TapeFrameCodec

void TapeEventAssembler::push(const TapeBackendEvent &chunk,
                              std::vector<TapeBackendEvent> &completed) {
    if (pending_.has_value()) {
        if (pending_->type == chunk.type) {
            pending_->text += chunk.text;
            pending_->data.insert(pending_->data.end(), chunk.data.begin(), chunk.data.end());
            if (TapeFrameCodec::getEventPayloadSize(chunk) < kChunkLimit) {
                completed.emplace_back(std::move(*pending_));
                pending_.reset();
            }
            return;
        }
        completed.emplace_back(std::move(*pending_));
        pending_.reset();
    }
    if (TapeFrameCodec::isChunkedEvent(chunk.type) &&
        TapeFrameCodec::getEventPayloadSize(chunk) == kChunkLimit) {
        pending_ = chunk;
        return;
    }
    completed.push_back(chunk);
}

void TapeEventAssembler::flush(std::vector<TapeBackendEvent> &completed) {
    if (!pending_.has_value())
        return;
    completed.emplace_back(std::move(*pending_));
    pending_.reset();
}
