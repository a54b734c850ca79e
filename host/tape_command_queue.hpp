#ifndef TAPE_HOST_COMMAND_QUEUE_HPP
#define TAPE_HOST_COMMAND_QUEUE_HPP

#include "tape_host_shared.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

class TapeCommandQueueListener {
  public:
    virtual ~TapeCommandQueueListener() {}

    virtual void onCommandStep(bool ignoreBreakpoints) = 0;
    virtual void onCommandSetBreakpoint(uint16_t address) = 0;
    virtual void onCommandClearBreakpoint(uint16_t address) = 0;
    virtual void onCommandRequestDump() = 0;
    virtual void onCommandInputKey(uint8_t key) = 0;
    virtual void onCommandInputString(const std::string &text) = 0;
    virtual void onCommandRequestMemory(uint16_t from, uint16_t to) = 0;
    virtual void onCommandRequestStack() = 0;
    virtual void onCommandSetMemory(uint16_t address, const std::vector<uint8_t> &bytes) = 0;
    virtual void onCommandSetRegister(uint8_t registerId, uint16_t value) = 0;
    virtual void onCommandStop() = 0;
    virtual void onCommandDecodeError(const TapeBackendError &error) = 0;
    //  once true, remaining commands are discarded
    virtual bool isCommandQueueHalted() const = 0;
};

//  Commands are queued either from raw wire bytes through receive() or
//  directly through the typed helpers.  Both preserve arrival order, and
//  decode failures are queued in sequence with the commands around them.
//
class TapeCommandQueue {
  public:
    static constexpr size_t kDefaultInputLimit = 4096;

    explicit TapeCommandQueue(size_t inputLimit = kDefaultInputLimit);

    bool isEmpty() const { return queue_.empty(); }
    size_t getSize() const { return queue_.size(); }
    //  bytes held back waiting for the rest of a frame
    size_t getPartialSize() const { return inbound_.size(); }
    //  an InputString whose last chunk was exactly TAPE_FRAME_CHUNK_LIMIT bytes
    bool hasPendingText() const { return pendingText_.has_value(); }

    //  Decodes as many complete frames as possible from the inbound bytes
    void receive(const uint8_t *data, size_t size);
    //  Completes an open InputString (end of stream)
    void flushPendingText();

    //  Executes every queued command.  Returns true if the listener halted.
    bool dispatchAll(TapeCommandQueueListener &listener);

    void step();
    void stepIgnoringBreakpoints();
    void setBreakpoint(uint16_t address);
    void clearBreakpoint(uint16_t address);
    void requestDump();
    void inputKey(uint8_t key);
    void inputString(std::string text);
    void requestMemory(uint16_t from, uint16_t to);
    void requestStack();
    void setMemory(uint16_t address, std::vector<uint8_t> bytes);
    void setRegister(uint8_t registerId, uint16_t value);
    void stop();

  private:
    struct Item {
        TapeBackendCommand command;
        std::optional<TapeBackendError> error;
    };

    void queue(TapeBackendCommand command);
    void queueError(TapeBackendError error);
    void appendText(const std::string &chunk);

    std::deque<Item> queue_;
    std::vector<uint8_t> inbound_;
    std::optional<std::string> pendingText_;
    bool pendingTextOverflow_;
    size_t inputLimit_;
};

#endif
