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

#include "pattern_table.hpp"
#include "synthesizer.hpp"

#include <nlterm_export.h>

#include <string>
#include <vector>

namespace nlterm::language
{
    // The translation step that produced an Interpretation.
    enum class Stage
    {
        MultiStep,
        Pattern,
        Keyword,
        Passthrough // no interpretation found, the phrase is executed verbatim
    };

    struct Interpretation
    {
        std::string command_line;
        std::string explanation;
        Stage       stage{Stage::Passthrough};
        std::string category; // rule category for MultiStep and Pattern

        bool is_passthrough() const { return stage == Stage::Passthrough; }
    };

    /**
     * @brief Turns a natural language phrase into a command line.
     *
     * The stages are tried in a fixed order and the first one that yields a command wins:
     * multi-step synthesis, the pattern table, keyword heuristics. If none applies the phrase
     * itself is returned. Matching is done on the trimmed, lower-cased phrase, so captured
     * file names are lower case as well. Translation never fails.
     */
    class NLTERM_EXPORT Translator
    {
    public:
        Translator();

        Interpretation interpret(const std::string& phrase) const;

        // Up to five example phrases that start with or contain `partial`.
        std::vector<std::string> suggest(const std::string& partial) const;

        static const std::string& help_text();

        const Synthesizer&  synthesizer() const { return _synthesizer; }
        const PatternTable& patterns() const { return _patterns; }

    private:
        Synthesizer         _synthesizer;
        const PatternTable& _patterns;
    };
}
