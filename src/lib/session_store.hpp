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
#include "engine.hpp"

#include <nlterm_export.h>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <mutex>
#include <string>

namespace nlterm::console
{
    /**
     * @brief Engines of many terminals, keyed by session id.
     *
     * The store itself is synchronized. Access to a single Engine goes through a Lease, which
     * holds the Engine's own lock, so one session never runs two commands at the same time
     * while different sessions proceed in parallel.
     */
    class NLTERM_EXPORT SessionStore
    {
        struct Entry
        {
            Entry(const Config& config, std::shared_ptr<platform::SystemInfo> system_info, Print print)
                : engine(config, std::move(system_info), std::move(print))
            {
            }

            std::mutex mutex;
            Engine     engine;
        };

    public:
        // Exclusive access to one Engine for as long as the Lease lives.
        class Lease
        {
        public:
            explicit Lease(std::shared_ptr<Entry> entry)
                : _entry(std::move(entry))
                , _lock(_entry->mutex)
            {
            }

            Engine& operator*() const { return _entry->engine; }
            Engine* operator->() const { return &_entry->engine; }

        private:
            std::shared_ptr<Entry>       _entry; // keeps the Engine alive after remove()
            std::unique_lock<std::mutex> _lock;
        };

        SessionStore(Config config, std::shared_ptr<platform::SystemInfo> system_info = nullptr, Print print = nullptr);

        // Gets the Engine of `id`, creating it if necessary, and locks it.
        Lease acquire(const std::string& id);

        bool   remove(const std::string& id);
        bool   contains(const std::string& id) const;
        size_t size() const;

    private:
        Config                                                             _config;
        std::shared_ptr<platform::SystemInfo>                              _system_info;
        Print                                                              _print;
        mutable std::mutex                                                 _mutex;
        ankerl::unordered_dense::map<std::string, std::shared_ptr<Entry>> _entries;
    };
}
