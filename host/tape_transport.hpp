#ifndef TAPE_HOST_TRANSPORT_HPP
#define TAPE_HOST_TRANSPORT_HPP

#include "tape_host_shared.hpp"

#include <iosfwd>
#include <mutex>

class TapeCommandQueue;
class TapeDevice;
struct TapeConfiguration;

//  Binds the protocol to a pair of byte streams.  Outbound events are encoded
//  and each frame is written whole before another writer can interleave.
//
class TapePipeTransport : public TapeEventListener {
  public:
    TapePipeTransport(std::istream &input, std::ostream &output);

    //  Blocks until at least one byte is available, then forwards everything
    //  already buffered to the queue.  Returns false at end of stream.
    bool pump(TapeCommandQueue &commands);
    //  True if more inbound bytes can be read without blocking.
    bool hasBufferedInput() const;

    void onTapeEvent(const TapeBackendEvent &event) final;

    size_t getFramesWritten() const { return framesWritten_; }
    bool hasFailed() const { return failed_; }

  private:
    std::istream &input_;
    std::ostream &output_;
    std::mutex outputMutex_;
    size_t framesWritten_;
    bool failed_;
};

//  Runs a piped debugging session until Stop, end of program, a crash or end
//  of the inbound stream.  Returns 0 on a normal exit.  Reads are sized by
//  what the stream buffer holds, so callers passing std::cin should disable
//  stdio synchronization first.
int runTapePipedSession(TapeDevice &device, std::istream &input, std::ostream &output,
                        const TapeConfiguration &config);

#endif
