#ifndef TAPE_HOST_CONFIGURATION_HPP
#define TAPE_HOST_CONFIGURATION_HPP

#include <cstddef>
#include <string>

#define TAPE_INPUT_LIMIT_DEFAULT 4096U
#define TAPE_INPUT_LIMIT_MAXIMUM (1024U * 1024U)

//  Settings for a piped session, stored as an INI file:
//
//      [host]
//      logger=1
//      logfile=
//      [protocol]
//      trace=0
//      input_limit=4096
//
struct TapeConfiguration {
    std::string iniPathname;
    int logLevel;
    std::string logFile;
    bool traceEnabled;
    size_t inputLimit;

    TapeConfiguration();

    //  Missing keys keep their defaults.  Returns false if the file could not
    //  be read or contained an invalid value.
    bool load(std::string pathname);
    bool save() const;

  private:
    static int handler(void *user, const char *section, const char *name, const char *value);
};

#endif
