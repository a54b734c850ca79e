#ifndef TAPE_HOST_IO_BRIDGE_HPP
#define TAPE_HOST_IO_BRIDGE_HPP

#include "core/tape_device.hpp"
#include "tape_host_shared.hpp"

#include <optional>
#include <string_view>

//  TapeIOBridge sits between the device program and the controller.
//      - Program output and error text is forwarded as Output/ErrorOutput
//        events of at most TAPE_FRAME_CHUNK_LIMIT bytes each.
//      - A program blocked on input leaves one pending request here until the
//        matching input arrives.
//
class TapeIOBridge : public TapeDeviceListener {
  public:
    explicit TapeIOBridge(TapeEventListener &events);

    //  Emits text as one or more events of the given type
    void emitText(TapeBackendEvent::Type type, std::string_view text);

    //  Records the request and emits KeyRequested/StringRequested
    void request(TapePendingInput kind);
    //  Checks supplied input against the pending request and clears it on a
    //  match.  A mismatch leaves the request unchanged.
    std::optional<TapeBackendError> resolve(TapePendingInput supplied);

    TapePendingInput getPending() const { return pending_; }
    bool isPending() const { return pending_ != TapePendingInput::None; }

  private:
    void onTapeDeviceOutput(std::string_view text) final;
    void onTapeDeviceErrorOutput(std::string_view text) final;

  private:
    TapeEventListener &events_;
    TapePendingInput pending_;
};

#endif
