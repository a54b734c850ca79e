#include "tape_io_bridge.hpp"

#include "fmt/format.h"

#include <algorithm>

TapeIOBridge::TapeIOBridge(TapeEventListener &events)
    : events_(events), pending_(TapePendingInput::None) {}

void TapeIOBridge::onTapeDeviceOutput(std::string_view text) {
    emitText(TapeBackendEvent::Output, text);
}

void TapeIOBridge::onTapeDeviceErrorOutput(std::string_view text) {
    emitText(TapeBackendEvent::ErrorOutput, text);
}

void TapeIOBridge::emitText(TapeBackendEvent::Type type, std::string_view text) {
    size_t offset = 0;
    do {
        size_t length = std::min(text.size() - offset, (size_t)TAPE_FRAME_CHUNK_LIMIT);
        TapeBackendEvent event;
        event.type = type;
        event.text = std::string(text.substr(offset, length));
        events_.onTapeEvent(event);
        offset += length;
    } while (offset < text.size());
}

void TapeIOBridge::request(TapePendingInput kind) {
    pending_ = kind;
    TapeBackendEvent event;
    switch (kind) {
    case TapePendingInput::AwaitingKey:
        event.type = TapeBackendEvent::KeyRequested;
        break;
    case TapePendingInput::AwaitingString:
        event.type = TapeBackendEvent::StringRequested;
        break;
    case TapePendingInput::None:
        return;
    }
    events_.onTapeEvent(event);
}

std::optional<TapeBackendError> TapeIOBridge::resolve(TapePendingInput supplied) {
    if (pending_ == TapePendingInput::None) {
        return TapeBackendError{
            TapeBackendError::ProtocolViolation,
            fmt::format("{} input received with no input request pending",
                        getTapePendingInputName(supplied))};
    }
    if (pending_ != supplied) {
        return TapeBackendError{TapeBackendError::ProtocolViolation,
                                fmt::format("{} input received while awaiting {} input",
                                            getTapePendingInputName(supplied),
                                            getTapePendingInputName(pending_))};
    }
    pending_ = TapePendingInput::None;
    return std::nullopt;
}
