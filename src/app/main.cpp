/*
Copyright (c) 2025, 2026 acrion innovations GmbH
Authors: Stefan Zipproth, s.zipproth@acrion.ch

This file is part of nlterm.

nlterm is offered under a commercial and under the AGPL license.
For commercial licensing, contact us at https://acrion.ch/sales. For AGPL licensing, see below.

AGPL licensing:

nlterm is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

nlterm is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with nlterm. If not, see <https://www.gnu.org/licenses/>.
*/

#include "interactive.hpp"
#include "string_utils.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace nlterm::console;

namespace
{
    void print_usage()
    {
        std::cout << "Usage: nlterm [cli|ai] [options]" << std::endl
                  << std::endl
                  << "  cli                    plain terminal (default)" << std::endl
                  << "  ai                     terminal that interprets natural language" << std::endl
                  << std::endl
                  << "  --history-file <path>  history file (default: .terminal_history)" << std::endl
                  << "  --no-history           neither read nor write a history file" << std::endl
                  << "  --timeout <seconds>    time limit for external commands (default: 30)" << std::endl
                  << "  --strict-exit-codes    report failed builtins with a non-zero exit code" << std::endl
                  << "  --verbose              log diagnostics to stderr" << std::endl
                  << "  --help                 show this help" << std::endl;
    }

    std::string next_value(int argc, char** argv, int& i)
    {
        if (i + 1 >= argc) throw std::runtime_error(std::string("Missing value for ") + argv[i]);
        return argv[++i];
    }
}

int main(int argc, char** argv)
{
    try
    {
        Config config;
        auto   state = std::make_shared<ReplState>();

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];

            if (arg == "cli")
                state->mode = InputMode::Shell;
            else if (arg == "ai")
                state->mode = InputMode::NaturalLanguage;
            else if (arg == "--history-file")
                config.history_file = next_value(argc, argv, i);
            else if (arg == "--no-history")
                config.persist_history = false;
            else if (arg == "--timeout")
            {
                const std::string value   = next_value(argc, argv, i);
                const auto        seconds = nlterm::string::parse_integer(value);
                if (!seconds || *seconds <= 0 || *seconds > max_external_timeout.count())
                {
                    throw std::runtime_error("Invalid timeout '" + value + "', expected 1 to " + std::to_string(max_external_timeout.count()) + " seconds");
                }
                config.external_timeout = std::chrono::seconds(*seconds);
            }
            else if (arg == "--strict-exit-codes")
                config.strict_exit_codes = true;
            else if (arg == "--verbose")
                state->verbose = true;
            else if (arg == "--help" || arg == "-h")
            {
                print_usage();
                return 0;
            }
            else
                throw std::runtime_error("Unknown argument '" + arg + "', see nlterm --help");
        }

        const bool verbose = state->verbose;
        Print      print   = [verbose](const std::string& str, const bool important)
        {
            if (important || verbose) std::clog << str << std::endl;
        };

        std::cout << (state->mode == InputMode::NaturalLanguage ? "Launching AI-Powered Terminal..." : "Launching CLI Terminal...") << std::endl;

        Interactive interactive(config, state, print);
        interactive.run(std::cin, std::cout);
    }
    catch (std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
