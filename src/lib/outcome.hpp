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

#include "command_error.hpp"

#include <nlterm_export.h>

#include <string>

namespace nlterm
{
    namespace console
    {
        // Result of a builtin: success text, or failure text together with the kind of failure.
        class NLTERM_EXPORT Outcome
        {
        public:
            static Outcome success(std::string text);
            static Outcome failure(ErrorKind kind, std::string text);
            static Outcome from(const command_error& error);

            bool               is_success() const;
            ErrorKind          kind() const;
            const std::string& text() const;

            // Appends the text of another per-target result as a new line, the first failure determines the kind.
            void append(const Outcome& other);

        private:
            enum class State
            {
                Success,
                Failure
            };

            Outcome(State state, ErrorKind kind, std::string text);

            State       _state{State::Success};
            ErrorKind   _kind{ErrorKind::Io};
            std::string _text;
            size_t      _parts{0};
        };

        // Exit code a builtin outcome is reported with.
        int NLTERM_EXPORT exit_code_for(const Outcome& outcome, bool strict_exit_codes);
    }
}
