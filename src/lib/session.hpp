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

#include <ankerl/unordered_dense.h>

#include <deque>
#include <filesystem>
#include <string>
#include <vector>

namespace nlterm
{
    namespace console
    {
        namespace fs = std::filesystem;

        using StringMap = ankerl::unordered_dense::map<std::string, std::string>;

        // Bounded command history, oldest entries are evicted first.
        class NLTERM_EXPORT History
        {
        public:
            explicit History(size_t capacity);

            void                     add(std::string line);
            std::vector<std::string> last(size_t count) const;
            size_t                   size() const { return _entries.size(); }
            bool                     empty() const { return _entries.empty(); }
            size_t                   capacity() const { return _capacity; }

        private:
            size_t                  _capacity;
            std::deque<std::string> _entries;
        };

        // The mutable state of one terminal conversation. A Session is owned by exactly one Engine.
        class NLTERM_EXPORT Session
        {
        public:
            Session(const fs::path& start_directory, size_t history_capacity);

            const fs::path& working_directory() const { return _working_directory; }

            // Resolves `target` like `cd` does and makes it the working directory.
            // Throws command_error (NotFound, PermissionDenied) and leaves the session unchanged on failure.
            const fs::path& change_directory(const std::string& target);

            // Maps an operand to a path: "~" and "~/..." relative to home, relative paths against the working directory.
            fs::path resolve(const std::string& operand) const;
            fs::path home() const;

            void               set_alias(const std::string& name, const std::string& value);
            const std::string* find_alias(const std::string& name) const;
            const StringMap&   aliases() const { return _aliases; }

            void             set_variable(const std::string& name, const std::string& value);
            // Sets the variable in this session and in the process environment, false if the process rejects it.
            bool             export_variable(const std::string& name, const std::string& value);
            std::string      variable(const std::string& name, const std::string& fallback = "") const;
            const StringMap& environment() const { return _environment; }

            History&       history() { return _history; }
            const History& history() const { return _history; }

        private:
            fs::path  _working_directory;
            StringMap _aliases;
            StringMap _environment;
            History   _history;
        };
    }
}
