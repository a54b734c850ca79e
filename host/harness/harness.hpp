#ifndef TAPE_HOST_WIRE_HARNESS_HPP
#define TAPE_HOST_WIRE_HARNESS_HPP

#include "tape_host_shared.hpp"

#include "nlohmann/json.hpp"

#include <iosfwd>
#include <optional>
#include <string>

//  Drives the wire protocol without a debugger attached.
//      - encode: scripted command objects ({"act": "step"}, ...) are turned
//        into command frames.
//      - decode: event frames are joined back into logical events and
//        printed as one JSON object per line.
//
class TapeWireHarness {
  public:
    TapeWireHarness();

    bool hasFailed() const { return failed_; }
    size_t getFrameCount() const { return frameCount_; }

    //  Encodes one command object to output
    bool run(const nlohmann::json &command, std::ostream &output);
    //  Decodes every event frame in input
    bool decode(std::istream &input, std::ostream &output);

    //  Builds a command from a scripted object, or nothing if it is malformed
    static std::optional<TapeBackendCommand> parseCommand(const nlohmann::json &command);
    static nlohmann::ordered_json describeEvent(const TapeBackendEvent &event);

  private:
    static bool parseAddress(const nlohmann::json &param, uint16_t &address);
    static bool parseRegisterId(const nlohmann::json &param, uint8_t &registerId);

    void printEvent(const TapeBackendEvent &event, std::ostream &output);

    size_t frameCount_;
    bool failed_;
};

#endif
