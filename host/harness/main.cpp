#include "harness.hpp"

#include "tape_configuration.hpp"
#include "tape_host_logging.hpp"

#include "fmt/color.h"
#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "nlohmann/json.hpp"

#include <cstring>
#include <fstream>
#include <iostream>

/*
    tape_harness [--config tape.ini] encode [script.json]
        [
            { "act": "break", "param": 16 },
            { "act": "step" },
            { "act": "register", "param": {"id": "d0", "value": 50} },
            { "act": "memory", "param": {"from": 0, "to": 16} },
            { "act": "key", "param": "a" },
            { "act": "stop" }
        ]

    tape_harness [--config tape.ini] decode [frames.bin]
*/

bool encode(TapeWireHarness &harness, std::istream &input, std::ostream &output) {
    bool commandOk = true;

    while (!input.eof() && !input.fail() && commandOk) {
        auto manifest = nlohmann::json::parse(input, nullptr, false);
        if (manifest.is_discarded()) {
            //  trailing whitespace after the last object
            if (input.eof())
                break;
            fmt::print(stderr, "Parse error\n");
            return false;
        }
        commandOk = false;
        if (manifest.is_object()) {
            commandOk = harness.run(manifest, output);
        } else if (manifest.is_array()) {
            commandOk = true;
            for (auto &item : manifest) {
                commandOk = harness.run(item, output);
                if (!commandOk)
                    break;
            }
        } else {
            fmt::print(stderr, "Command syntax not valid:\n{}\n", manifest.dump());
        }
        input >> std::ws;
    }
    output.flush();
    return commandOk;
}

int main(int argc, const char *argv[]) {
    TapeConfiguration config;
    int argsUsed = 1;
    const char *mode = nullptr;
    const char *inputPath = nullptr;

    while (argsUsed < argc) {
        const char *arg = argv[argsUsed++];
        if (strcmp(arg, "--config") == 0) {
            if (argsUsed >= argc) {
                std::cerr << "Argument " << arg << " expects a value." << std::endl;
                return 1;
            }
            if (!config.load(argv[argsUsed++])) {
                std::cerr << "Failed to load configuration " << argv[argsUsed - 1] << std::endl;
                return 1;
            }
        } else if (mode == nullptr) {
            mode = arg;
        } else if (inputPath == nullptr) {
            inputPath = arg;
        } else {
            std::cerr << "Unexpected argument " << arg << std::endl;
            return 1;
        }
    }
    if (mode == nullptr || (strcmp(mode, "encode") != 0 && strcmp(mode, "decode") != 0)) {
        std::cerr << "usage: tape_harness [--config <file.ini>] encode|decode [input]"
                  << std::endl;
        return 1;
    }

    try {
        setupTapeLogger(config);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Unable to create logger: " << ex.what() << std::endl;
        return 1;
    }

    std::ifstream inp;
    if (inputPath != nullptr) {
        inp.open(inputPath, std::ios_base::in | std::ios_base::binary);
        if (!inp.is_open()) {
            std::cerr << "Failed to open input stream " << inputPath << std::endl;
            return 1;
        }
    }
    std::istream &input = inputPath != nullptr ? static_cast<std::istream &>(inp) : std::cin;

    TapeWireHarness harness;
    bool executeSuccess;
    if (strcmp(mode, "encode") == 0) {
        executeSuccess = encode(harness, input, std::cout);
    } else {
        executeSuccess = harness.decode(input, std::cout);
    }

    if (harness.hasFailed() || !executeSuccess) {
        fmt::print(stderr, fg(fmt::terminal_color::red), "FAILED\n");
        return 1;
    }
    fmt::print(stderr, fg(fmt::terminal_color::bright_green), "OK ({} frames)\n",
               harness.getFrameCount());
    return 0;
}
