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

#include <string>

namespace nlterm::console
{
    // Output of a builtin or an external command as seen by front ends.
    struct CommandResult
    {
        std::string output;
        int         exit_code{0};
    };

    // Output value telling the attached front end to end the session.
    inline const std::string exit_sentinel = "EXIT_TERMINAL";

    // Output of `clear`, interpreted by the front end.
    inline const std::string clear_sequence = "\033[2J\033[H";
}
