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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace nlterm::console
{
    // Diagnostic sink. The flag marks messages that should reach the user even in quiet mode.
    using Print = std::function<void(const std::string&, bool)>;

    // Upper bound for Config::external_timeout, poll() takes its wait in int milliseconds.
    constexpr std::chrono::seconds max_external_timeout{86400};

    struct Config
    {
        size_t                    history_capacity    = 1000;
        size_t                    history_display     = 50;
        std::chrono::seconds      external_timeout    = std::chrono::seconds(30);
        int                       tree_max_depth      = 3;
        size_t                    top_process_count   = 10;
        std::chrono::milliseconds top_sample_interval = std::chrono::milliseconds(1000);
        size_t                    completion_limit    = 10;
        bool                      strict_exit_codes   = false; // false: builtin failures report exit code 0, the message is the signal
        std::filesystem::path     start_directory;             // empty: process working directory
        std::filesystem::path     history_file        = ".terminal_history";
        bool                      persist_history     = true;
    };
}
