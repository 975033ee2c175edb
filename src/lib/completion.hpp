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

#include "session.hpp"

#include <nlterm_export.h>

#include <string>
#include <vector>

namespace nlterm::console
{
    // Tab completion: command names for the first word, directory entries for all others.
    class NLTERM_EXPORT Completer
    {
    public:
        Completer(std::vector<std::string> command_names, size_t limit);

        std::vector<std::string> complete(const Session& session, const std::string& text, const std::string& line) const;

    private:
        std::vector<std::string> complete_command(const std::string& text) const;
        std::vector<std::string> complete_path(const Session& session, const std::string& text) const;

        std::vector<std::string> _commands;
        size_t                   _limit;
    };
}
