#ifndef TAPE_DEFS_H
#define TAPE_DEFS_H

/** Machine layout */
#define TAPE_DATA_REG_COUNT 4
#define TAPE_ADDR_REG_COUNT 2
#define TAPE_MEMORY_SIZE    (64 * 1024)

/** Register identifiers used by the SetRegister command */
#define TAPE_REG_ACC      0x00
#define TAPE_REG_D0       0x01
#define TAPE_REG_D1       0x02
#define TAPE_REG_D2       0x03
#define TAPE_REG_D3       0x04
#define TAPE_REG_A0       0x05
#define TAPE_REG_A1       0x06
#define TAPE_REG_PC       0x07
#define TAPE_REG_SP       0x08
#define TAPE_REG_FP       0x09
#define TAPE_REG_OVERFLOW 0x0A
#define TAPE_REG_COUNT    0x0B

/** Frame layout */
#define TAPE_FRAME_CHUNK_LIMIT 255

/** Named keys accepted by the InputKey command */
#define TAPE_KEY_BACKSPACE 0x08
#define TAPE_KEY_TAB       0x09
#define TAPE_KEY_RETURN    0x0A
#define TAPE_KEY_ESCAPE    0x1B
#define TAPE_KEY_SPACE     0x20

/** Logging levels */
#define TAPE_DEBUG_LOG_DEBUG 0
#define TAPE_DEBUG_LOG_INFO  1
#define TAPE_DEBUG_LOG_WARN  2
#define TAPE_DEBUG_LOG_ERROR 3
#define TAPE_DEBUG_LOG_FATAL 4

#endif
