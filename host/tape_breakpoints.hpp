#ifndef TAPE_HOST_BREAKPOINTS_HPP
#define TAPE_HOST_BREAKPOINTS_HPP

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>

//  Execution breakpoints keyed by instruction address.  Only a plain Step
//  consults the registry.
class TapeBreakpoints {
  public:
    //  both return true if the registry changed
    bool set(uint16_t address);
    bool clear(uint16_t address);

    bool contains(uint16_t address) const;
    size_t size() const { return addresses_.size(); }
    bool empty() const { return addresses_.empty(); }
    //  sorted list of addresses, for diagnostics
    std::vector<uint16_t> list() const;

  private:
    std::unordered_set<uint16_t> addresses_;
};

#endif
