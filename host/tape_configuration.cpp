#include "tape_configuration.hpp"

#include "tape_defs.h"

#include "fmt/format.h"
#include "ini.h"
#include "spdlog/spdlog.h"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>

TapeConfiguration::TapeConfiguration()
    : logLevel(TAPE_DEBUG_LOG_INFO), traceEnabled(false), inputLimit(TAPE_INPUT_LIMIT_DEFAULT) {}

bool TapeConfiguration::load(std::string pathname) {
    iniPathname = std::move(pathname);
    int result = ini_parse(iniPathname.c_str(), &TapeConfiguration::handler, this);
    if (result < 0) {
        spdlog::warn("TapeConfiguration: unable to read {}", iniPathname);
        return false;
    }
    if (result > 0) {
        spdlog::warn("TapeConfiguration: {} has an error on line {}", iniPathname, result);
        return false;
    }
    return true;
}

bool TapeConfiguration::save() const {
    FILE *fp = fopen(iniPathname.c_str(), "w");
    if (fp == NULL) {
        spdlog::error("TapeConfiguration: failed to write {}", iniPathname);
        return false;
    }
    fmt::print(fp,
               "[host]\n"
               "logger={}\n"
               "logfile={}\n"
               "\n",
               logLevel, logFile);
    fmt::print(fp,
               "[protocol]\n"
               "trace={}\n"
               "input_limit={}\n",
               traceEnabled ? 1 : 0, inputLimit);
    fclose(fp);

    spdlog::info("Configuration saved.");
    return true;
}

int TapeConfiguration::handler(void *user, const char *section, const char *name,
                               const char *value) {
    auto *config = reinterpret_cast<TapeConfiguration *>(user);
    if (strncmp(section, "host", 16) == 0) {
        if (strncmp(name, "logger", 16) == 0) {
            int logLevel;
            const char *end = value + strlen(value);
            if (std::from_chars(value, end, logLevel).ec != std::errc{} ||
                logLevel < TAPE_DEBUG_LOG_DEBUG || logLevel > TAPE_DEBUG_LOG_FATAL) {
                fmt::print(stderr, "Invalid logger configuration {}={}\n", name, value);
                return 0;
            }
            config->logLevel = logLevel;
        } else if (strncmp(name, "logfile", 16) == 0) {
            config->logFile = value;
        }
    } else if (strncmp(section, "protocol", 16) == 0) {
        if (strncmp(name, "trace", 16) == 0) {
            config->traceEnabled = atoi(value) > 0;
        } else if (strncmp(name, "input_limit", 16) == 0) {
            size_t limit;
            const char *end = value + strlen(value);
            if (std::from_chars(value, end, limit).ec != std::errc{} || limit == 0 ||
                limit > TAPE_INPUT_LIMIT_MAXIMUM) {
                fmt::print(stderr, "Invalid input_limit configuration {}={}\n", name, value);
                return 0;
            }
            config->inputLimit = limit;
        }
    }
    return 1;
}
