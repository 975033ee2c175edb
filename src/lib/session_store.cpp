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

#include "session_store.hpp"

using namespace nlterm::console;

SessionStore::SessionStore(Config config, std::shared_ptr<platform::SystemInfo> system_info, Print print)
    : _config(std::move(config))
    , _system_info(std::move(system_info))
    , _print(std::move(print))
{
}

SessionStore::Lease SessionStore::acquire(const std::string& id)
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(_mutex);

        auto it = _entries.find(id);
        if (it == _entries.end())
        {
            it = _entries.emplace(id, std::make_shared<Entry>(_config, _system_info, _print)).first;
            if (_print) _print("Created session " + id, false);
        }
        entry = it->second;
    }

    // The store lock is released first, a busy session must not block the others.
    return Lease(std::move(entry));
}

bool SessionStore::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    const bool removed = _entries.erase(id) > 0;
    if (removed && _print) _print("Removed session " + id, false);
    return removed;
}

bool SessionStore::contains(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.find(id) != _entries.end();
}

size_t SessionStore::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}
