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

#include "natural_terminal.hpp"

using namespace nlterm;
using namespace nlterm::language;

NaturalTerminal::NaturalTerminal(const console::Config&                config,
                                 std::shared_ptr<platform::SystemInfo> system_info,
                                 console::Print                        print)
    : _engine(config, std::move(system_info), print)
    , _print(std::move(print))
{
}

NaturalResult NaturalTerminal::execute_natural_language(const std::string& phrase)
{
    Interpretation interpretation = _translator.interpret(phrase);
    if (_print && !interpretation.is_passthrough())
    {
        _print("'" + phrase + "' -> '" + interpretation.command_line + "'", false);
    }

    console::CommandResult result = _engine.execute(interpretation.command_line);
    return {std::move(result), std::move(interpretation)};
}
