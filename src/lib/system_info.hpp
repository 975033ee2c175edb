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

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nlterm
{
    namespace platform
    {
        struct ProcessInfo
        {
            int         pid{0};
            std::string name;
            double      cpu_percent{0};
            double      memory_percent{0};
        };

        struct MemoryInfo
        {
            uint64_t total{0};
            uint64_t available{0};
            uint64_t used{0};
            uint64_t free{0};
            double   percent{0};

            uint64_t swap_total{0};
            uint64_t swap_used{0};
            uint64_t swap_free{0};
            double   swap_percent{0};
        };

        struct Partition
        {
            std::string device;
            std::string mountpoint;
            std::string fstype;
        };

        struct DiskUsage
        {
            uint64_t total{0};
            uint64_t used{0};
            uint64_t free{0};
            double   percent{0};
        };

        // Source of process and resource snapshots used by ps, top, df and free.
        class NLTERM_EXPORT SystemInfo
        {
        public:
            virtual ~SystemInfo() = default;

            // CPU usage of each process is averaged over its lifetime.
            virtual std::vector<ProcessInfo> processes() const = 0;

            // CPU usage of each process is measured over `interval`.
            virtual std::vector<ProcessInfo> sample_processes(std::chrono::milliseconds interval) const = 0;

            virtual double                 cpu_percent(std::chrono::milliseconds interval) const = 0;
            virtual MemoryInfo             memory() const                                        = 0;
            virtual std::vector<Partition> partitions() const                                    = 0;

            // Throws std::system_error if the file system cannot be queried.
            virtual DiskUsage disk_usage(const std::string& path) const = 0;
        };

        // Linux implementation reading /proc and calling statvfs.
        class NLTERM_EXPORT ProcfsSystemInfo final : public SystemInfo
        {
        public:
            std::vector<ProcessInfo> processes() const override;
            std::vector<ProcessInfo> sample_processes(std::chrono::milliseconds interval) const override;
            double                   cpu_percent(std::chrono::milliseconds interval) const override;
            MemoryInfo               memory() const override;
            std::vector<Partition>   partitions() const override;
            DiskUsage                disk_usage(const std::string& path) const override;
        };

        constexpr uint64_t GiB = 1024ull * 1024 * 1024;
    }
}
