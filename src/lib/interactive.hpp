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

#include "config.hpp"
#include "repl_state.hpp"

#include <nlterm_export.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace nlterm
{
    namespace language
    {
        class NaturalTerminal;
    }

    namespace console
    {
        // Line oriented terminal over a pair of streams, in plain shell mode or with natural language interpretation.
        class NLTERM_EXPORT Interactive
        {
        public:
            Interactive(const Config& config, std::shared_ptr<ReplState> state, Print print);
            ~Interactive();

            // Reads lines from `in` until `exit` or end of input.
            void run(std::istream& in, std::ostream& out) const;

            language::NaturalTerminal& terminal() const;
            static std::string         get_version();

            Interactive(const Interactive&)            = delete;
            Interactive& operator=(const Interactive&) = delete;

        private:
            class Impl;
            Impl* const _pImpl; // must stay at top of members list because of initialization order
        };
    }
}
