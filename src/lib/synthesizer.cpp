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

#include "synthesizer.hpp"

using namespace nlterm::language;

namespace
{
    std::vector<PatternRule> compound_rules()
    {
        std::vector<PatternRule> rules;
        rules.emplace_back("create_and_move",
                           R"(create.*?(?:folder|directory).*?(?:called|named)\s+(\S+).*?and.*?move.*?(\S+).*?(?:into|to).*?it)",
                           "mkdir {0} && mv {1} {0}/");
        rules.emplace_back("copy_by_extension",
                           R"(copy.*?all.*?(\.\w+).*?files?.*?to.*?(\S+))",
                           "cp *{0} {1}/");
        rules.emplace_back("delete_all_in_directory",
                           R"(delete.*?all.*?files?.*?in.*?(\S+))",
                           "rm {0}/*");
        rules.emplace_back("find_and_delete",
                           R"(find.*?and.*?delete.*?files?.*?(?:called|named).*?(\S+))",
                           R"(find . -name "{0}" -delete)");
        return rules;
    }
}

Synthesizer::Synthesizer()
    : _rules(compound_rules())
{
}

std::optional<PatternMatch> Synthesizer::synthesize(const std::string& phrase) const
{
    return _rules.match(phrase);
}
