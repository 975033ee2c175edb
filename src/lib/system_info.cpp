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

#include "system_info.hpp"

#include <boost/algorithm/string.hpp>

#include <sys/statvfs.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace nlterm
{
    namespace platform
    {
        namespace
        {
            struct ProcessTicks
            {
                int         pid{0};
                std::string name;
                uint64_t    ticks{0};      // utime + stime
                uint64_t    start_time{0}; // clock ticks after boot
                uint64_t    rss_pages{0};
            };

            bool read_process(int pid, ProcessTicks& out)
            {
                std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
                if (!stat.is_open()) return false;

                std::string content;
                std::getline(stat, content);

                // the command name is enclosed in parentheses and may itself contain blanks or ')'
                const size_t open  = content.find('(');
                const size_t close = content.rfind(')');
                if (open == std::string::npos || close == std::string::npos || close < open) return false;

                std::istringstream       rest(content.substr(close + 1));
                std::vector<std::string> fields;
                for (std::string field; rest >> field;)
                {
                    fields.push_back(field);
                }
                if (fields.size() < 22) return false;

                try
                {
                    out.pid        = pid;
                    out.name       = content.substr(open + 1, close - open - 1);
                    out.ticks      = std::stoull(fields[11]) + std::stoull(fields[12]);
                    out.start_time = std::stoull(fields[19]);
                    out.rss_pages  = std::stoull(fields[21]);
                }
                catch (const std::logic_error&)
                {
                    return false;
                }
                return true;
            }

            std::vector<ProcessTicks> read_all_processes()
            {
                std::vector<ProcessTicks> result;
                std::error_code           ec;
                for (const auto& entry : std::filesystem::directory_iterator("/proc", ec))
                {
                    const std::string name = entry.path().filename().string();
                    if (name.empty() || !std::all_of(name.begin(), name.end(), ::isdigit)) continue;

                    ProcessTicks ticks;
                    if (read_process(std::stoi(name), ticks)) // vanished or inaccessible processes are skipped
                    {
                        result.push_back(std::move(ticks));
                    }
                }
                return result;
            }

            std::map<std::string, uint64_t> read_meminfo()
            {
                std::ifstream meminfo("/proc/meminfo");
                if (!meminfo.is_open()) throw std::runtime_error("Could not open /proc/meminfo");

                std::map<std::string, uint64_t> values;
                for (std::string line; std::getline(meminfo, line);)
                {
                    std::istringstream iss(line);
                    std::string        key;
                    uint64_t           kb = 0;
                    if (iss >> key >> kb)
                    {
                        if (!key.empty() && key.back() == ':') key.pop_back();
                        values[key] = kb * 1024;
                    }
                }
                return values;
            }

            uint64_t total_memory()
            {
                auto values = read_meminfo();
                return values["MemTotal"];
            }

            double uptime_seconds()
            {
                std::ifstream uptime("/proc/uptime");
                double        seconds = 0;
                uptime >> seconds;
                return seconds;
            }

            // /proc/mounts escapes blanks and a few other characters as \ooo
            std::string unescape_mount_field(const std::string& field)
            {
                std::string result;
                for (size_t i = 0; i < field.size(); ++i)
                {
                    if (field[i] == '\\' && i + 3 < field.size()
                        && std::isdigit(static_cast<unsigned char>(field[i + 1]))
                        && std::isdigit(static_cast<unsigned char>(field[i + 2]))
                        && std::isdigit(static_cast<unsigned char>(field[i + 3])))
                    {
                        result.push_back(static_cast<char>(std::stoi(field.substr(i + 1, 3), nullptr, 8)));
                        i += 3;
                    }
                    else
                    {
                        result.push_back(field[i]);
                    }
                }
                return result;
            }

            double percent_of(uint64_t part, uint64_t whole)
            {
                return whole == 0 ? 0.0 : static_cast<double>(part) * 100.0 / static_cast<double>(whole);
            }
        }

        std::vector<ProcessInfo> ProcfsSystemInfo::processes() const
        {
            const long     clock_ticks = ::sysconf(_SC_CLK_TCK);
            const long     page_size   = ::sysconf(_SC_PAGESIZE);
            const uint64_t mem_total   = total_memory();
            const double   uptime      = uptime_seconds();

            std::vector<ProcessInfo> result;
            for (const ProcessTicks& p : read_all_processes())
            {
                const double elapsed = uptime - static_cast<double>(p.start_time) / static_cast<double>(clock_ticks);
                const double cpu     = elapsed > 0 ? static_cast<double>(p.ticks) / static_cast<double>(clock_ticks) / elapsed * 100.0 : 0.0;
                result.push_back({p.pid, p.name, cpu, percent_of(p.rss_pages * static_cast<uint64_t>(page_size), mem_total)});
            }
            return result;
        }

        std::vector<ProcessInfo> ProcfsSystemInfo::sample_processes(std::chrono::milliseconds interval) const
        {
            const long     clock_ticks = ::sysconf(_SC_CLK_TCK);
            const long     page_size   = ::sysconf(_SC_PAGESIZE);
            const uint64_t mem_total   = total_memory();

            std::map<int, uint64_t> before;
            for (const ProcessTicks& p : read_all_processes())
            {
                before[p.pid] = p.ticks;
            }

            std::this_thread::sleep_for(interval);

            const double seconds = std::chrono::duration<double>(interval).count();

            std::vector<ProcessInfo> result;
            for (const ProcessTicks& p : read_all_processes())
            {
                auto   it  = before.find(p.pid);
                double cpu = 0;
                if (it != before.end() && seconds > 0 && p.ticks >= it->second)
                {
                    cpu = static_cast<double>(p.ticks - it->second) / static_cast<double>(clock_ticks) / seconds * 100.0;
                }
                result.push_back({p.pid, p.name, cpu, percent_of(p.rss_pages * static_cast<uint64_t>(page_size), mem_total)});
            }
            return result;
        }

        double ProcfsSystemInfo::cpu_percent(std::chrono::milliseconds interval) const
        {
            auto read_cpu = []() -> std::pair<uint64_t, uint64_t>
            {
                std::ifstream stat("/proc/stat");
                std::string   label;
                stat >> label;
                if (label != "cpu") throw std::runtime_error("Unexpected format of /proc/stat");

                uint64_t values[8] = {};
                for (uint64_t& v : values)
                {
                    stat >> v;
                }

                uint64_t total = 0;
                for (uint64_t v : values)
                {
                    total += v;
                }
                return {total, values[3] + values[4]}; // idle + iowait
            };

            const auto first = read_cpu();
            std::this_thread::sleep_for(interval);
            const auto second = read_cpu();

            const uint64_t total = second.first - first.first;
            const uint64_t idle  = second.second - first.second;
            return total == 0 ? 0.0 : percent_of(total - idle, total);
        }

        MemoryInfo ProcfsSystemInfo::memory() const
        {
            auto values = read_meminfo();

            MemoryInfo info;
            info.total     = values["MemTotal"];
            info.free      = values["MemFree"];
            info.available = values.count("MemAvailable") ? values["MemAvailable"] : info.free;

            const uint64_t cached = values["Cached"] + values["SReclaimable"] + values["Buffers"];
            info.used             = info.total > info.free + cached ? info.total - info.free - cached : 0;
            info.percent          = percent_of(info.total - std::min(info.total, info.available), info.total);

            info.swap_total   = values["SwapTotal"];
            info.swap_free    = values["SwapFree"];
            info.swap_used    = info.swap_total - std::min(info.swap_total, info.swap_free);
            info.swap_percent = percent_of(info.swap_used, info.swap_total);
            return info;
        }

        std::vector<Partition> ProcfsSystemInfo::partitions() const
        {
            // Only file systems backed by a device, like psutil.disk_partitions(all=False).
            std::set<std::string> physical;
            {
                std::ifstream filesystems("/proc/filesystems");
                for (std::string line; std::getline(filesystems, line);)
                {
                    if (!boost::algorithm::starts_with(line, "nodev"))
                    {
                        physical.insert(boost::algorithm::trim_copy(line));
                    }
                }
                physical.insert("zfs");
            }

            std::ifstream mounts("/proc/self/mounts");
            if (!mounts.is_open()) throw std::runtime_error("Could not open /proc/self/mounts");

            std::vector<Partition> result;
            for (std::string line; std::getline(mounts, line);)
            {
                std::istringstream iss(line);
                Partition          partition;
                if (!(iss >> partition.device >> partition.mountpoint >> partition.fstype)) continue;
                if (!physical.count(partition.fstype)) continue;

                partition.device     = unescape_mount_field(partition.device);
                partition.mountpoint = unescape_mount_field(partition.mountpoint);
                result.push_back(std::move(partition));
            }
            return result;
        }

        DiskUsage ProcfsSystemInfo::disk_usage(const std::string& path) const
        {
            struct statvfs st{};
            if (::statvfs(path.c_str(), &st) != 0)
            {
                throw std::system_error(errno, std::generic_category(), path);
            }

            DiskUsage usage;
            usage.total                 = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
            usage.free                  = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
            usage.used                  = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * st.f_frsize;
            const uint64_t user_visible = usage.used + usage.free;
            usage.percent               = percent_of(usage.used, user_visible);
            return usage;
        }
    }
}
