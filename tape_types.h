#ifndef TAPE_TYPES_H
#define TAPE_TYPES_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "tape_defs.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Register file of a device.  acc and the data registers are 8-bit; the
   address registers, pc, sp and fp address the full 16-bit space.
*/
typedef struct TapeMachine {
    uint16_t pc;
    uint8_t acc;
    uint16_t sp;
    uint16_t fp;
    uint8_t data_reg[TAPE_DATA_REG_COUNT];
    uint16_t addr_reg[TAPE_ADDR_REG_COUNT];
    bool overflowed;
} TapeMachine;

/* Stack region reported by a device as [begin, end) */
typedef struct TapeStackRange {
    uint32_t begin;
    uint32_t end;
} TapeStackRange;

#ifdef __cplusplus
}
#endif

#endif
