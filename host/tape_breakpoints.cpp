#include "tape_breakpoints.hpp"

#include <algorithm>

bool TapeBreakpoints::set(uint16_t address) { return addresses_.insert(address).second; }

bool TapeBreakpoints::clear(uint16_t address) { return addresses_.erase(address) > 0; }

bool TapeBreakpoints::contains(uint16_t address) const {
    return addresses_.find(address) != addresses_.end();
}

std::vector<uint16_t> TapeBreakpoints::list() const {
    std::vector<uint16_t> result(addresses_.begin(), addresses_.end());
    std::sort(result.begin(), result.end());
    return result;
}
