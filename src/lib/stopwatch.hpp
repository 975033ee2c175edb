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

#include <chrono>
#include <string>

namespace nlterm
{
    // Measures the time since construction, until stop() is called.
    class StopWatch
    {
    public:
        using clock = std::chrono::steady_clock;

        StopWatch();

        void stop();

        std::chrono::milliseconds elapsed() const;
        std::chrono::milliseconds remaining(std::chrono::milliseconds budget) const;
        bool                      exceeded(std::chrono::milliseconds budget) const { return elapsed() >= budget; }

        // Elapsed time as "<seconds>.<millis>s", e.g. "0.042s".
        std::string format() const;

        StopWatch(const StopWatch&)            = delete;
        StopWatch& operator=(const StopWatch&) = delete;

    private:
        const clock::time_point _start;
        clock::time_point       _stop;
        bool                    _running{true};
    };
}
