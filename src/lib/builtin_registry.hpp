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
#include "outcome.hpp"
#include "session.hpp"

#include <nlterm_export.h>

#include <memory>
#include <optional>
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
        // The closed set of commands implemented natively by the engine.
        enum class Builtin
        {
            Cd,
            Pwd,
            Ls,
            Mkdir,
            Rmdir,
            Rm,
            Touch,
            Cat,
            Echo,
            Cp,
            Mv,
            Find,
            Grep,
            Ps,
            Kill,
            Top,
            Df,
            Free,
            Whoami,
            Date,
            History,
            Clear,
            Exit,
            Help,
            Alias,
            Env,
            Set,
            Tree
        };

        /**
         * @brief Maps command names to builtins and runs them against a Session.
         *
         * Expected failures (missing operands, absent files, denied access) are returned as
         * failed Outcomes. Anything else a handler throws is left to the caller, which is
         * the Engine's failure boundary.
         */
        class NLTERM_EXPORT BuiltinRegistry
        {
        public:
            BuiltinRegistry(const Config& config, std::shared_ptr<platform::SystemInfo> system_info);
            ~BuiltinRegistry();

            std::optional<Builtin> find(const std::string& name) const;

            // All accepted names, including synonyms, in registration order.
            const std::vector<std::string>& names() const;

            Outcome invoke(Builtin builtin, Session& session, const std::vector<std::string>& args) const;

            static const std::string& help_text();

            BuiltinRegistry(const BuiltinRegistry&)            = delete;
            BuiltinRegistry& operator=(const BuiltinRegistry&) = delete;

        private:
            class Impl;
            std::unique_ptr<Impl> _pImpl;
        };
    }
}
