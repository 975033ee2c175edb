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
#include "config.hpp"
#include "session.hpp"

#include <nlterm_export.h>

#include <memory>
#include <string>
#include <vector>

namespace nlterm
{
    namespace platform
    {
        class SystemInfo;
    }

    namespace console
    {
        /**
         * @brief Executes command lines against one Session.
         *
         * A line is tokenized with shell quoting rules, split at `&&`, alias-substituted and
         * dispatched to a builtin or to an external program. All failures are reported through
         * the returned CommandResult, `execute` only throws if memory runs out.
         *
         * An Engine is not synchronized. Hosts that serve several terminals keep one Engine per
         * terminal, see SessionStore.
         */
        class NLTERM_EXPORT Engine
        {
        public:
            // `system_info` may be null, the /proc implementation is used then.
            Engine(const Config& config, std::shared_ptr<platform::SystemInfo> system_info = nullptr, Print print = nullptr);
            ~Engine();

            CommandResult execute(const std::string& line);

            // user@host:dir$
            std::string prompt() const;

            std::vector<std::string> history(size_t count) const;

            // Completion candidates for the word `text` at the end of `line`.
            std::vector<std::string> complete(const std::string& text, const std::string& line) const;

            const Session& session() const;
            Session&       session();
            const Config&  config() const;

            Engine(const Engine&)            = delete;
            Engine& operator=(const Engine&) = delete;

        private:
            class Impl;
            Impl* const _pImpl; // must stay at top of members list because of initialization order
        };
    }
}
