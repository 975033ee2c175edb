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

#pragma once

#include "command_result.hpp"
#include "config.hpp"
#include "session.hpp"

#include <nlterm_export.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace nlterm::console
{
    // Runs commands that are not builtins as child processes.
    class NLTERM_EXPORT ExternalExecutor
    {
    public:
        ExternalExecutor(std::chrono::seconds timeout, Print print);

        /**
         * @brief Runs `name` with `args` in `cwd` and waits for it, at most for the configured timeout.
         *
         * The child gets `environment` as its environment and /dev/null as standard input.
         * The returned output is everything the child wrote to standard output followed by
         * everything it wrote to standard error.
         *
         * @return exit code of the child, 128 + signal number if it was killed by a signal,
         *         127 if the executable was not found, 1 on timeout and launch failures.
         */
        CommandResult run(const std::string&              name,
                          const std::vector<std::string>& args,
                          const std::filesystem::path&    cwd,
                          const StringMap&                environment) const;

        std::chrono::seconds timeout() const { return _timeout; }

    private:
        std::chrono::seconds _timeout;
        Print                _print;
    };
}
