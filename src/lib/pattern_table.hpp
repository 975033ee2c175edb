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

#include <nlterm_export.h>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace nlterm::language
{
    // One phrase pattern. The groups captured by `regex` fill the placeholders {0}, {1}, ... of `command`.
    struct PatternRule
    {
        PatternRule(std::string category, const std::string& pattern, std::string command);

        std::string category;
        std::string pattern;
        std::regex  regex;
        std::string command;
    };

    struct PatternMatch
    {
        const PatternRule* rule;
        std::string        command_line;
    };

    // Ordered list of rules. The first rule whose regex is found in a phrase wins.
    class NLTERM_EXPORT PatternTable
    {
    public:
        explicit PatternTable(std::vector<PatternRule> rules);

        // The single-command phrase rules, grouped by category.
        static const PatternTable& standard();

        // `phrase` is expected to be lower case already.
        std::optional<PatternMatch> match(const std::string& phrase) const;

        const std::vector<PatternRule>& rules() const { return _rules; }

    private:
        std::vector<PatternRule> _rules;
    };
}
