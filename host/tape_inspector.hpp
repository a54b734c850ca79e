#ifndef TAPE_HOST_INSPECTOR_HPP
#define TAPE_HOST_INSPECTOR_HPP

#include "tape_host_shared.hpp"

#include <optional>
#include <string>
#include <vector>

class TapeDevice;

//  Reads and writes device state on behalf of the controller.  Nothing is
//  cached; every call goes to the device.  Failed writes leave the device
//  untouched.
class TapeStateInspector {
  public:
    using Error = std::optional<TapeBackendError>;

    explicit TapeStateInspector(TapeDevice &device);

    TapeDeviceSnapshot dump() const;
    //  {"pc","acc","sp","fp","data_reg","addr_reg","overflowed"} in that order
    static std::string toJSON(const TapeDeviceSnapshot &snapshot);

    //  Reads [from, to)
    Error readMemory(std::vector<uint8_t> &out, uint16_t from, uint16_t to) const;
    Error readStack(std::vector<uint8_t> &out) const;
    Error writeMemory(uint16_t address, const std::vector<uint8_t> &bytes);
    //  Register ids are TAPE_REG_XXX.  Values wider than the register are
    //  rejected.
    Error writeRegister(uint8_t registerId, uint16_t value);

  private:
    TapeDevice &device_;
};

#endif
