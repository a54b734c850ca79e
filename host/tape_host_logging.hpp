#ifndef TAPE_HOST_LOGGING_HPP
#define TAPE_HOST_LOGGING_HPP

struct TapeConfiguration;

//  Installs the default "tape" logger.  Console output goes to stderr since
//  stdout carries protocol frames in piped mode.
void setupTapeLogger(const TapeConfiguration &config);

#endif
