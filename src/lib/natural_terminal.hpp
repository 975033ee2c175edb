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
#include "engine.hpp"
#include "translator.hpp"

#include <nlterm_export.h>

#include <memory>
#include <string>

namespace nlterm::language
{
    struct NaturalResult
    {
        console::CommandResult result;
        Interpretation         interpretation;
    };

    // An Engine that accepts natural language phrases as well as command lines.
    class NLTERM_EXPORT NaturalTerminal
    {
    public:
        NaturalTerminal(const console::Config&                config,
                        std::shared_ptr<platform::SystemInfo> system_info = nullptr,
                        console::Print                        print       = nullptr);

        NaturalResult execute_natural_language(const std::string& phrase);

        console::Engine&       engine() { return _engine; }
        const console::Engine& engine() const { return _engine; }
        const Translator&      translator() const { return _translator; }

    private:
        console::Engine _engine;
        Translator      _translator;
        console::Print  _print;
    };
}
