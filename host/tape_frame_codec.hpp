#ifndef TAPE_HOST_FRAME_CODEC_HPP
#define TAPE_HOST_FRAME_CODEC_HPP

#include "tape_host_shared.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

//  Wire format for the debug protocol.  Every frame is a prefix byte followed
//  by a payload whose layout is fixed by the prefix.  2-byte fields are
//  big-endian.  Strings and byte blocks are sent as <len:1><bytes:len>; a
//  logical payload longer than TAPE_FRAME_CHUNK_LIMIT is split into
//  consecutive frames of the same prefix where all but the last chunk are
//  exactly TAPE_FRAME_CHUNK_LIMIT bytes.
//
namespace TapeFrameCodec {

using Frame = std::vector<uint8_t>;

enum class DecodeStatus { Ok, NeedMore, Error };

template <typename T> struct DecodeResult {
    DecodeStatus status = DecodeStatus::NeedMore;
    //  bytes to drop from the front of the input, valid for Ok and Error
    size_t consumed = 0;
    T value;
    TapeBackendError error{TapeBackendError::DecodeError, {}};
};

//  Decodes the first inbound command frame found in data.  InputString frames
//  are decoded one chunk at a time; joining them is left to the caller.
//  An unrecognized prefix consumes every byte up to the next recognized
//  prefix (or the end of data) and reports them as a single error.
DecodeResult<TapeBackendCommand> decodeCommand(const uint8_t *data, size_t size);
//  Decodes the first outbound event frame found in data.  Chunked payloads
//  are returned per frame; see TapeEventAssembler.
DecodeResult<TapeBackendEvent> decodeEvent(const uint8_t *data, size_t size);

std::vector<Frame> encodeCommand(const TapeBackendCommand &command);
std::vector<Frame> encodeEvent(const TapeBackendEvent &event);

bool isCommandPrefix(uint8_t prefix);
bool isEventPrefix(uint8_t prefix);
bool isSupportedKey(uint8_t key);

//  true for event kinds whose payload may span several frames
bool isChunkedEvent(TapeBackendEvent::Type type);
size_t getEventPayloadSize(const TapeBackendEvent &event);

} // namespace TapeFrameCodec

//  Joins chunked events received from the wire back into logical events.
//  A chunk of exactly TAPE_FRAME_CHUNK_LIMIT bytes stays open until a frame
//  of another kind, a shorter chunk, or flush() arrives.
class TapeEventAssembler {
  public:
    void push(const TapeBackendEvent &chunk, std::vector<TapeBackendEvent> &completed);
    void flush(std::vector<TapeBackendEvent> &completed);

    bool hasPending() const { return pending_.has_value(); }

  private:
    std::optional<TapeBackendEvent> pending_;
};

#endif
