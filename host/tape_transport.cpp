#include "tape_transport.hpp"
#include "tape_backend.hpp"
#include "tape_command_queue.hpp"
#include "tape_configuration.hpp"
#include "tape_frame_codec.hpp"

#include "spdlog/spdlog.h"

#include <istream>
#include <ostream>

namespace {

constexpr size_t kReadBufferSize = 4096;

} // namespace

TapePipeTransport::TapePipeTransport(std::istream &input, std::ostream &output)
    : input_(input), output_(output), framesWritten_(0), failed_(false) {}

bool TapePipeTransport::pump(TapeCommandQueue &commands) {
    char buffer[kReadBufferSize];
    auto ch = input_.get();
    if (ch == std::istream::traits_type::eof())
        return false;
    buffer[0] = std::istream::traits_type::to_char_type(ch);
    size_t count = 1 + (size_t)input_.readsome(buffer + 1, sizeof(buffer) - 1);
    commands.receive(reinterpret_cast<const uint8_t *>(buffer), count);
    return true;
}

bool TapePipeTransport::hasBufferedInput() const { return input_.rdbuf()->in_avail() > 0; }

void TapePipeTransport::onTapeEvent(const TapeBackendEvent &event) {
    auto frames = TapeFrameCodec::encodeEvent(event);
    std::lock_guard<std::mutex> lock(outputMutex_);
    for (auto &frame : frames) {
        output_.write(reinterpret_cast<const char *>(frame.data()), (std::streamsize)frame.size());
        output_.flush();
        if (!output_.good()) {
            if (!failed_) {
                spdlog::error("Outbound stream failed after {} frame(s)", framesWritten_);
            }
            failed_ = true;
            return;
        }
        ++framesWritten_;
    }
}

int runTapePipedSession(TapeDevice &device, std::istream &input, std::ostream &output,
                        const TapeConfiguration &config) {
    TapePipeTransport transport(input, output);
    TapeCommandQueue commands(config.inputLimit);
    TapeBackend::Config backendConfig;
    backendConfig.traceEnabled = config.traceEnabled;
    TapeBackend backend(device, transport, backendConfig);

    spdlog::info("Piped session started");
    bool ended = false;
    while (!ended && !transport.hasFailed()) {
        if (!transport.pump(commands)) {
            //  end of input behaves like Stop once everything received is applied
            commands.flushPendingText();
            commands.stop();
            backend.step(commands);
            if (commands.getPartialSize() > 0) {
                spdlog::warn("{} byte(s) of an incomplete frame discarded at end of input",
                             commands.getPartialSize());
            }
            spdlog::info("Inbound stream closed");
            break;
        }
        if (!transport.hasBufferedInput()) {
            //  a 255 byte InputString chunk only joins a follow-up already in
            //  the buffer; otherwise it completes before the next blocking read
            commands.flushPendingText();
        }
        ended = backend.step(commands);
    }
    spdlog::info("Piped session ended ({} frame(s) sent)", transport.getFramesWritten());
    return transport.hasFailed() ? 1 : 0;
}
