#include "tape_command_queue.hpp"
#include "tape_frame_codec.hpp"

#include "fmt/format.h"

TapeCommandQueue::TapeCommandQueue(size_t inputLimit)
    : pendingTextOverflow_(false), inputLimit_(inputLimit) {}

void TapeCommandQueue::receive(const uint8_t *data, size_t size) {
    inbound_.insert(inbound_.end(), data, data + size);

    size_t offset = 0;
    while (offset < inbound_.size()) {
        auto result = TapeFrameCodec::decodeCommand(inbound_.data() + offset,
                                                    inbound_.size() - offset);
        if (result.status == TapeFrameCodec::DecodeStatus::NeedMore)
            break;
        offset += result.consumed;
        if (result.status == TapeFrameCodec::DecodeStatus::Error) {
            flushPendingText();
            queueError(std::move(result.error));
        } else if (result.value.type == TapeBackendCommand::InputString) {
            appendText(result.value.text);
        } else {
            flushPendingText();
            queue(std::move(result.value));
        }
    }
    inbound_.erase(inbound_.begin(), inbound_.begin() + offset);
}

void TapeCommandQueue::appendText(const std::string &chunk) {
    if (!pendingText_.has_value()) {
        pendingText_.emplace();
    }
    if (!pendingTextOverflow_) {
        if (pendingText_->size() + chunk.size() > inputLimit_) {
            pendingTextOverflow_ = true;
            pendingText_->clear();
        } else {
            pendingText_->append(chunk);
        }
    }
    if (chunk.size() < TAPE_FRAME_CHUNK_LIMIT) {
        flushPendingText();
    }
}

void TapeCommandQueue::flushPendingText() {
    if (!pendingText_.has_value())
        return;
    if (pendingTextOverflow_) {
        queueError(TapeBackendError{
            TapeBackendError::DecodeError,
            fmt::format("input string exceeds the {} byte limit", inputLimit_)});
    } else {
        TapeBackendCommand command;
        command.type = TapeBackendCommand::InputString;
        command.text = std::move(*pendingText_);
        queue(std::move(command));
    }
    pendingText_.reset();
    pendingTextOverflow_ = false;
}

bool TapeCommandQueue::dispatchAll(TapeCommandQueueListener &listener) {
    bool halted = listener.isCommandQueueHalted();
    while (!queue_.empty() && !halted) {
        Item item = std::move(queue_.front());
        queue_.pop_front();

        if (item.error.has_value()) {
            listener.onCommandDecodeError(*item.error);
            halted = listener.isCommandQueueHalted();
            continue;
        }
        const TapeBackendCommand &cmd = item.command;
        switch (cmd.type) {
        case TapeBackendCommand::Undefined:
            break;
        case TapeBackendCommand::Step:
            listener.onCommandStep(false);
            break;
        case TapeBackendCommand::StepIgnoringBreakpoints:
            listener.onCommandStep(true);
            break;
        case TapeBackendCommand::SetBreakpoint:
            listener.onCommandSetBreakpoint(cmd.address);
            break;
        case TapeBackendCommand::ClearBreakpoint:
            listener.onCommandClearBreakpoint(cmd.address);
            break;
        case TapeBackendCommand::RequestDump:
            listener.onCommandRequestDump();
            break;
        case TapeBackendCommand::InputKey:
            listener.onCommandInputKey(cmd.key);
            break;
        case TapeBackendCommand::InputString:
            listener.onCommandInputString(cmd.text);
            break;
        case TapeBackendCommand::RequestMemory:
            listener.onCommandRequestMemory(cmd.address, cmd.addressEnd);
            break;
        case TapeBackendCommand::RequestStack:
            listener.onCommandRequestStack();
            break;
        case TapeBackendCommand::SetMemory:
            listener.onCommandSetMemory(cmd.address, cmd.bytes);
            break;
        case TapeBackendCommand::SetRegister:
            listener.onCommandSetRegister(cmd.registerId, cmd.value);
            break;
        case TapeBackendCommand::Stop:
            listener.onCommandStop();
            break;
        }
        halted = listener.isCommandQueueHalted();
    }
    if (halted) {
        queue_.clear();
    }
    return halted;
}

void TapeCommandQueue::queue(TapeBackendCommand command) {
    queue_.push_back(Item{std::move(command), std::nullopt});
}

void TapeCommandQueue::queueError(TapeBackendError error) {
    queue_.push_back(Item{TapeBackendCommand(), std::move(error)});
}

void TapeCommandQueue::step() {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::Step;
    queue(std::move(command));
}

void TapeCommandQueue::stepIgnoringBreakpoints() {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::StepIgnoringBreakpoints;
    queue(std::move(command));
}

void TapeCommandQueue::setBreakpoint(uint16_t address) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::SetBreakpoint;
    command.address = address;
    queue(std::move(command));
}

void TapeCommandQueue::clearBreakpoint(uint16_t address) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::ClearBreakpoint;
    command.address = address;
    queue(std::move(command));
}

void TapeCommandQueue::requestDump() {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::RequestDump;
    queue(std::move(command));
}

void TapeCommandQueue::inputKey(uint8_t key) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::InputKey;
    command.key = key;
    queue(std::move(command));
}

void TapeCommandQueue::inputString(std::string text) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::InputString;
    command.text = std::move(text);
    queue(std::move(command));
}

void TapeCommandQueue::requestMemory(uint16_t from, uint16_t to) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::RequestMemory;
    command.address = from;
    command.addressEnd = to;
    queue(std::move(command));
}

void TapeCommandQueue::requestStack() {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::RequestStack;
    queue(std::move(command));
}

void TapeCommandQueue::setMemory(uint16_t address, std::vector<uint8_t> bytes) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::SetMemory;
    command.address = address;
    command.bytes = std::move(bytes);
    queue(std::move(command));
}

void TapeCommandQueue::setRegister(uint8_t registerId, uint16_t value) {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::SetRegister;
    command.registerId = registerId;
    command.value = value;
    queue(std::move(command));
}

void TapeCommandQueue::stop() {
    TapeBackendCommand command;
    command.type = TapeBackendCommand::Stop;
    queue(std::move(command));
}
