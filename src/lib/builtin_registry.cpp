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

#include "builtin_registry.hpp"

#include "command_error.hpp"
#include "command_result.hpp"
#include "string_utils.hpp"
#include "system_info.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/algorithm/string.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <future>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

using namespace nlterm;
using console::Builtin;
using console::ErrorKind;
using console::Outcome;
using console::Session;

namespace
{
    namespace fs = std::filesystem;

    constexpr std::array<std::pair<const char*, Builtin>, 35> name_table{{
        {"cd", Builtin::Cd},
        {"pwd", Builtin::Pwd},
        {"ls", Builtin::Ls},
        {"dir", Builtin::Ls},
        {"mkdir", Builtin::Mkdir},
        {"rmdir", Builtin::Rmdir},
        {"rm", Builtin::Rm},
        {"del", Builtin::Rm},
        {"touch", Builtin::Touch},
        {"cat", Builtin::Cat},
        {"type", Builtin::Cat},
        {"echo", Builtin::Echo},
        {"cp", Builtin::Cp},
        {"copy", Builtin::Cp},
        {"mv", Builtin::Mv},
        {"move", Builtin::Mv},
        {"find", Builtin::Find},
        {"grep", Builtin::Grep},
        {"ps", Builtin::Ps},
        {"kill", Builtin::Kill},
        {"top", Builtin::Top},
        {"df", Builtin::Df},
        {"free", Builtin::Free},
        {"whoami", Builtin::Whoami},
        {"date", Builtin::Date},
        {"history", Builtin::History},
        {"clear", Builtin::Clear},
        {"cls", Builtin::Clear},
        {"exit", Builtin::Exit},
        {"quit", Builtin::Exit},
        {"help", Builtin::Help},
        {"alias", Builtin::Alias},
        {"env", Builtin::Env},
        {"set", Builtin::Set},
        {"tree", Builtin::Tree},
    }};

    const std::string process_header = "PID   NAME                     CPU%   MEM%";

    bool is_permission_error(const std::error_code& ec)
    {
        return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
    }

    ErrorKind kind_of(const std::error_code& ec)
    {
        if (is_permission_error(ec)) return ErrorKind::PermissionDenied;
        if (ec == std::errc::no_such_file_or_directory) return ErrorKind::NotFound;
        return ErrorKind::Io;
    }

    std::error_code last_error()
    {
        return std::error_code(errno, std::generic_category());
    }

    bool is_flag(const std::string& arg)
    {
        return arg.size() > 1 && arg[0] == '-';
    }

    // True if `arg` is the long flag `long_name` or a cluster of short flags containing `letter`.
    bool has_flag(const std::string& arg, char letter, const char* long_name)
    {
        if (arg == long_name) return true;
        if (!is_flag(arg) || arg[1] == '-') return false;
        return arg.find(letter, 1) != std::string::npos;
    }

    std::vector<std::string> operands(const std::vector<std::string>& args)
    {
        std::vector<std::string> result;
        std::copy_if(args.begin(), args.end(), std::back_inserter(result), [](const std::string& a)
                     { return !is_flag(a); });
        return result;
    }

    std::string gib(uint64_t bytes)
    {
        return std::to_string(bytes / platform::GiB) + ".0GB";
    }

    std::string percent(double value)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << value;
        return ss.str();
    }

    std::string format_process(const platform::ProcessInfo& p)
    {
        std::ostringstream ss;
        ss << std::left << std::setw(5) << p.pid << ' '
           << std::setw(20) << p.name << ' '
           << std::fixed << std::setprecision(1)
           << std::setw(6) << p.cpu_percent << ' '
           << std::setw(6) << p.memory_percent;
        return ss.str();
    }

    std::string format_time(std::time_t t, const char* format)
    {
        std::tm local{};
        localtime_r(&t, &local);
        std::ostringstream ss;
        ss << std::put_time(&local, format);
        return ss.str();
    }

    std::string format_entry(const fs::path& path, bool long_format)
    {
        const std::string name = path.filename().string();
        if (!long_format) return name;

        struct stat link_st{};
        struct stat st{};
        if (::lstat(path.c_str(), &link_st) != 0 || ::stat(path.c_str(), &st) != 0) return name;

        const char type = S_ISDIR(st.st_mode) ? 'd' : (S_ISLNK(link_st.st_mode) ? 'l' : '-');

        std::ostringstream ss;
        ss << type << std::oct << (st.st_mode & 0777) << std::dec << ' '
           << std::right << std::setw(8) << st.st_size << ' '
           << format_time(st.st_mtime, "%Y-%m-%d %H:%M") << ' ' << name;
        return ss.str();
    }

    // Sorted names of the entries in `dir`. Sets `ec` if the directory cannot be read.
    std::vector<std::string> list_directory(const fs::path& dir, std::error_code& ec)
    {
        std::vector<std::string> names;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            names.push_back(it->path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }
}

class console::BuiltinRegistry::Impl
{
public:
    Impl(const Config& config, std::shared_ptr<platform::SystemInfo> system_info)
        : _config(config)
        , _system_info(system_info ? std::move(system_info) : std::make_shared<platform::ProcfsSystemInfo>())
    {
        for (const auto& [name, builtin] : name_table)
        {
            _names.emplace_back(name);
            _lookup.emplace(name, builtin);
        }
    }

    std::optional<Builtin> find(const std::string& name) const
    {
        auto it = _lookup.find(name);
        if (it == _lookup.end()) return std::nullopt;
        return it->second;
    }

    const std::vector<std::string>& names() const { return _names; }

    Outcome invoke(Builtin builtin, Session& s, const std::vector<std::string>& args) const
    {
        try
        {
            switch (builtin)
            {
            case Builtin::Cd:
                return cmd_cd(s, args);
            case Builtin::Pwd:
                return Outcome::success(s.working_directory().string());
            case Builtin::Ls:
                return cmd_ls(s, args);
            case Builtin::Mkdir:
                return cmd_mkdir(s, args);
            case Builtin::Rmdir:
                return cmd_rmdir(s, args);
            case Builtin::Rm:
                return cmd_rm(s, args);
            case Builtin::Touch:
                return cmd_touch(s, args);
            case Builtin::Cat:
                return cmd_cat(s, args);
            case Builtin::Echo:
                return Outcome::success(boost::algorithm::join(args, " "));
            case Builtin::Cp:
                return cmd_cp(s, args);
            case Builtin::Mv:
                return cmd_mv(s, args);
            case Builtin::Find:
                return cmd_find(s, args);
            case Builtin::Grep:
                return cmd_grep(s, args);
            case Builtin::Ps:
                return cmd_ps();
            case Builtin::Kill:
                return cmd_kill(args);
            case Builtin::Top:
                return cmd_top();
            case Builtin::Df:
                return cmd_df();
            case Builtin::Free:
                return cmd_free();
            case Builtin::Whoami:
                return Outcome::success(s.variable("USER", s.variable("USERNAME", "unknown")));
            case Builtin::Date:
                return Outcome::success(format_time(std::time(nullptr), "%Y-%m-%d %H:%M:%S"));
            case Builtin::History:
                return cmd_history(s);
            case Builtin::Clear:
                return Outcome::success(clear_sequence);
            case Builtin::Exit:
                return Outcome::success(exit_sentinel);
            case Builtin::Help:
                return Outcome::success(help_text());
            case Builtin::Alias:
                return cmd_alias(s, args);
            case Builtin::Env:
                return cmd_env(s);
            case Builtin::Set:
                return cmd_set(s, args);
            case Builtin::Tree:
                return cmd_tree(s, args);
            }
        }
        catch (const command_error& error)
        {
            return Outcome::from(error);
        }

        throw std::logic_error("Unhandled builtin");
    }

    static const std::string& help_text()
    {
        static const std::string text = boost::algorithm::trim_copy(std::string(R"(
Natural Language Terminal - Available Commands:

File Operations:
  ls, dir          - List directory contents
  cd               - Change directory
  pwd              - Print working directory
  mkdir            - Create directory
  rmdir            - Remove empty directory
  rm, del          - Remove files/directories
  touch            - Create empty file
  cat, type        - Display file contents
  cp, copy         - Copy files/directories
  mv, move         - Move/rename files/directories
  find             - Find files and directories
  grep             - Search text in files
  tree             - Display directory tree

System Monitoring:
  ps               - List processes
  kill             - Kill process by PID
  top              - Display system resource usage
  df               - Display filesystem usage
  free             - Display memory usage

Utilities:
  echo             - Echo text
  whoami           - Display current user
  date             - Display current date/time
  history          - Show command history
  clear, cls       - Clear screen
  env              - Show environment variables
  set              - Set environment variable
  alias            - Create command aliases
  help             - Show this help

Navigation:
  exit, quit       - Exit terminal

Commands can be chained with &&, other commands are run as external programs.
)"));
        return text;
    }

private:
    // --- File system ---

    Outcome cmd_cd(Session& s, const std::vector<std::string>& args) const
    {
        const fs::path& target = s.change_directory(args.empty() ? "~" : args[0]);
        return Outcome::success("Changed directory to: " + target.string());
    }

    Outcome cmd_ls(const Session& s, const std::vector<std::string>& args) const
    {
        bool        show_hidden = false;
        bool        long_format = false;
        std::string operand;

        for (const std::string& arg : args)
        {
            if (is_flag(arg))
            {
                show_hidden = show_hidden || has_flag(arg, 'a', "--all");
                long_format = long_format || has_flag(arg, 'l', "--long");
            }
            else if (operand.empty())
            {
                operand = arg;
            }
        }

        const fs::path    path  = operand.empty() ? s.working_directory() : s.resolve(operand);
        const std::string shown = operand.empty() ? path.string() : operand;

        std::error_code       ec;
        const fs::file_status st = fs::status(path, ec);
        if (is_permission_error(ec)) return Outcome::failure(ErrorKind::PermissionDenied, "Permission denied: " + shown);
        if (!fs::exists(st)) return Outcome::failure(ErrorKind::NotFound, "Path not found: " + shown);
        if (!fs::is_directory(st)) return Outcome::success(format_entry(path, long_format));

        const std::vector<std::string> names = list_directory(path, ec);
        if (ec)
        {
            if (is_permission_error(ec)) return Outcome::failure(ErrorKind::PermissionDenied, "Permission denied: " + shown);
            return Outcome::failure(kind_of(ec), "Error listing directory: " + ec.message());
        }

        std::vector<std::string> lines;
        for (const std::string& name : names)
        {
            if (!show_hidden && name[0] == '.') continue;
            lines.push_back(format_entry(path / name, long_format));
        }

        if (lines.empty()) return Outcome::success("Directory is empty");
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    Outcome cmd_mkdir(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: mkdir <directory_name>");

        Outcome result = Outcome::success("");
        for (const std::string& arg : args)
        {
            std::error_code ec;
            fs::create_directories(s.resolve(arg), ec);
            if (ec)
                result.append(Outcome::failure(kind_of(ec), "Error creating " + arg + ": " + ec.message()));
            else
                result.append(Outcome::success("Created directory: " + arg));
        }
        return result;
    }

    Outcome cmd_rmdir(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: rmdir <directory_name>");

        Outcome result = Outcome::success("");
        for (const std::string& arg : args)
        {
            const fs::path  path = s.resolve(arg);
            std::error_code ec;
            const auto      st = fs::symlink_status(path, ec);

            if (!fs::exists(st) && !is_permission_error(ec))
            {
                result.append(Outcome::failure(ErrorKind::NotFound, "Directory not found: " + arg));
                continue;
            }
            if (!ec && !fs::is_directory(st)) ec = std::make_error_code(std::errc::not_a_directory);
            if (!ec) fs::remove(path, ec);

            if (ec)
                result.append(Outcome::failure(kind_of(ec), "Error removing " + arg + ": " + ec.message()));
            else
                result.append(Outcome::success("Removed directory: " + arg));
        }
        return result;
    }

    Outcome cmd_rm(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: rm [-r] <file_or_directory>");

        bool recursive = false;
        bool force     = false;
        for (const std::string& arg : args)
        {
            recursive = recursive || has_flag(arg, 'r', "--recursive") || has_flag(arg, 'R', "--recursive");
            force     = force || has_flag(arg, 'f', "--force");
        }

        const std::vector<std::string> files = operands(args);
        if (files.empty()) return Outcome::failure(ErrorKind::Usage, "No files specified");

        Outcome result = Outcome::success("");
        for (const std::string& file : files)
        {
            const fs::path  path = s.resolve(file);
            std::error_code ec;
            const auto      st = fs::symlink_status(path, ec);

            if (is_permission_error(ec))
            {
                result.append(Outcome::failure(ErrorKind::PermissionDenied, "Permission denied: " + file));
                continue;
            }
            if (!fs::exists(st))
            {
                if (!force) result.append(Outcome::failure(ErrorKind::NotFound, "File not found: " + file));
                continue;
            }

            std::string done;
            if (fs::is_directory(st))
            {
                if (!recursive)
                {
                    result.append(Outcome::failure(ErrorKind::Usage, "Cannot remove directory " + file + ": use -r flag"));
                    continue;
                }
                fs::remove_all(path, ec);
                done = "Removed directory tree: " + file;
            }
            else
            {
                fs::remove(path, ec);
                done = "Removed file: " + file;
            }

            if (is_permission_error(ec))
                result.append(Outcome::failure(ErrorKind::PermissionDenied, "Permission denied: " + file));
            else if (ec)
                result.append(Outcome::failure(kind_of(ec), "Error removing " + file + ": " + ec.message()));
            else
                result.append(Outcome::success(done));
        }
        return result;
    }

    Outcome cmd_touch(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: touch <filename>");

        Outcome result = Outcome::success("");
        for (const std::string& arg : args)
        {
            const fs::path path = s.resolve(arg);

            const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0666);
            if (fd < 0 || ::close(fd) != 0 || ::utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0)
            {
                const std::error_code ec = last_error();
                result.append(Outcome::failure(kind_of(ec), "Error touching " + arg + ": " + ec.message()));
                continue;
            }
            result.append(Outcome::success("Touched: " + arg));
        }
        return result;
    }

    Outcome cmd_cat(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: cat <filename>");

        Outcome result = Outcome::success("");
        for (const std::string& arg : args)
        {
            try
            {
                const std::string content = read_text_file(s.resolve(arg), arg, "Error reading ");
                if (args.size() > 1) result.append(Outcome::success("==> " + arg + " <=="));
                result.append(Outcome::success(content));
            }
            catch (const command_error& error)
            {
                result.append(Outcome::from(error));
            }
        }
        return result;
    }

    // Reads a whole file, which must be valid UTF-8. Failures are reported in terms of the operand `shown`.
    static std::string read_text_file(const fs::path& path, const std::string& shown, const std::string& error_prefix)
    {
        std::error_code ec;
        const auto      st = fs::status(path, ec);
        if (is_permission_error(ec)) throw command_error(ErrorKind::PermissionDenied, "Permission denied: " + shown);
        if (!fs::exists(st)) throw command_error(ErrorKind::NotFound, "File not found: " + shown);
        if (fs::is_directory(st))
            throw command_error(ErrorKind::Io, error_prefix + shown + ": " + std::make_error_code(std::errc::is_a_directory).message());
        if (::access(path.c_str(), R_OK) != 0)
        {
            ec = last_error();
            if (is_permission_error(ec)) throw command_error(ErrorKind::PermissionDenied, "Permission denied: " + shown);
            throw command_error(kind_of(ec), error_prefix + shown + ": " + ec.message());
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) throw command_error(ErrorKind::Io, error_prefix + shown + ": " + last_error().message());

        std::ostringstream content;
        content << in.rdbuf();
        std::string text = content.str();

        if (!string::is_valid_utf8(text)) throw command_error(ErrorKind::Io, "Cannot display binary file: " + shown);
        return text;
    }

    Outcome cmd_cp(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.size() < 2) return Outcome::failure(ErrorKind::Usage, "Usage: cp [-r] <source> <destination>");

        const bool recursive = std::any_of(args.begin(), args.end(), [](const std::string& a)
                                           { return has_flag(a, 'r', "--recursive") || has_flag(a, 'R', "--recursive"); });

        const std::vector<std::string> files = operands(args);
        if (files.size() < 2) return Outcome::failure(ErrorKind::Usage, "Source and destination required");

        const std::string& dest      = files.back();
        const fs::path     dest_path = s.resolve(dest);
        const bool         into_dir  = fs::is_directory(dest_path);

        if (files.size() > 2 && !into_dir) return Outcome::failure(ErrorKind::Usage, "Target is not a directory: " + dest);

        Outcome result = Outcome::success("");
        for (size_t i = 0; i + 1 < files.size(); ++i)
        {
            const std::string& source      = files[i];
            const fs::path     source_path = s.resolve(source);
            const fs::path     target      = into_dir ? dest_path / source_path.filename() : dest_path;

            std::error_code ec;
            const auto      st = fs::status(source_path, ec);
            if (!fs::exists(st) && !is_permission_error(ec))
            {
                result.append(Outcome::failure(ErrorKind::NotFound, "Source not found: " + source));
                continue;
            }

            std::string done;
            if (fs::is_directory(st))
            {
                if (!recursive)
                {
                    result.append(Outcome::failure(ErrorKind::Usage, "Cannot copy directory " + source + ": use -r flag"));
                    continue;
                }
                if (!ec) fs::create_directory(target, ec);
                if (!ec) fs::copy(source_path, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
                done = "Copied directory tree: " + source + " -> " + dest;
            }
            else
            {
                if (!ec) fs::copy_file(source_path, target, fs::copy_options::overwrite_existing, ec);
                if (!ec) fs::last_write_time(target, fs::last_write_time(source_path), ec);
                done = "Copied file: " + source + " -> " + dest;
            }

            if (ec)
                result.append(Outcome::failure(kind_of(ec), "Error copying: " + ec.message()));
            else
                result.append(Outcome::success(done));
        }
        return result;
    }

    Outcome cmd_mv(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.size() < 2) return Outcome::failure(ErrorKind::Usage, "Usage: mv <source> <destination>");

        const std::string& dest      = args.back();
        const fs::path     dest_path = s.resolve(dest);
        const bool         into_dir  = fs::is_directory(dest_path);

        if (args.size() > 2 && !into_dir) return Outcome::failure(ErrorKind::Usage, "Target is not a directory: " + dest);

        Outcome result = Outcome::success("");
        for (size_t i = 0; i + 1 < args.size(); ++i)
        {
            const std::string& source      = args[i];
            const fs::path     source_path = s.resolve(source);
            const fs::path     target      = into_dir ? dest_path / source_path.filename() : dest_path;

            std::error_code ec;
            if (!fs::exists(fs::symlink_status(source_path, ec)) && !is_permission_error(ec))
            {
                result.append(Outcome::failure(ErrorKind::NotFound, "Source not found: " + source));
                continue;
            }

            if (!ec) fs::rename(source_path, target, ec);
            if (ec == std::errc::cross_device_link)
            {
                ec.clear();
                fs::copy(source_path, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
                if (!ec) fs::remove_all(source_path, ec);
            }

            if (ec)
                result.append(Outcome::failure(kind_of(ec), "Error moving: " + ec.message()));
            else
                result.append(Outcome::success("Moved: " + source + " -> " + dest));
        }
        return result;
    }

    Outcome cmd_find(const Session& s, const std::vector<std::string>& args) const
    {
        static const std::string usage = "Usage: find <path> -name <pattern>";
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, usage);

        std::string root_operand;
        std::string pattern;
        char        type = 0;
        bool        del  = false;

        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string& arg = args[i];
            if (arg == "-name" || arg == "-type")
            {
                if (i + 1 >= args.size()) return Outcome::failure(ErrorKind::Usage, usage);
                const std::string& value = args[++i];
                if (arg == "-name")
                {
                    pattern = value;
                }
                else
                {
                    if (value != "f" && value != "d") return Outcome::failure(ErrorKind::Usage, usage);
                    type = value[0];
                }
            }
            else if (arg == "-delete")
            {
                del = true;
            }
            else if (i == 0)
            {
                root_operand = arg;
            }
            else
            {
                return Outcome::failure(ErrorKind::Usage, usage);
            }
        }

        fs::path root = root_operand.empty() ? s.working_directory() : s.resolve(root_operand).lexically_normal();
        if (!root.has_filename() && root != root.root_path()) root = root.parent_path();

        std::vector<std::pair<fs::path, bool>> matches;
        walk(root, pattern, type, matches);

        if (matches.empty()) return Outcome::success("No matches found");

        std::vector<std::string> lines;
        if (!del)
        {
            for (const auto& [path, is_dir] : matches)
                lines.push_back(path.string());
            return Outcome::success(boost::algorithm::join(lines, "\n"));
        }

        // Parents are listed before their entries, so reverse order removes the deepest entries first.
        // A matched directory that still holds unmatched entries is kept and reported.
        Outcome result = Outcome::success("");
        for (auto it = matches.rbegin(); it != matches.rend(); ++it)
        {
            std::error_code ec;
            fs::remove(it->first, ec);

            if (ec)
                result.append(Outcome::failure(kind_of(ec), "Error removing " + it->first.string() + ": " + ec.message()));
            else
                result.append(Outcome::success("Deleted: " + it->first.string()));
        }
        return result;
    }

    // Lists all entries of `dir` (directories first, each group sorted by name), then descends
    // into the subdirectories in the same order. Unreadable directories are skipped.
    static void walk(const fs::path& dir, const std::string& pattern, char type, std::vector<std::pair<fs::path, bool>>& matches)
    {
        std::error_code                ec;
        const std::vector<std::string> names = list_directory(dir, ec);
        if (ec) return;

        std::vector<std::string> dirs, files;
        for (const std::string& name : names)
        {
            std::error_code entry_ec;
            (fs::is_directory(dir / name, entry_ec) ? dirs : files).push_back(name);
        }

        auto visit = [&](const std::string& name, bool is_dir)
        {
            if (!pattern.empty() && !string::matches_glob(name, pattern)) return;
            if (type == 'f' && is_dir) return;
            if (type == 'd' && !is_dir) return;
            matches.emplace_back(dir / name, is_dir);
        };

        for (const std::string& name : dirs)
            visit(name, true);
        for (const std::string& name : files)
            visit(name, false);

        for (const std::string& name : dirs)
        {
            std::error_code link_ec;
            if (!fs::is_symlink(dir / name, link_ec)) walk(dir / name, pattern, type, matches);
        }
    }

    Outcome cmd_grep(const Session& s, const std::vector<std::string>& args) const
    {
        if (args.size() < 2) return Outcome::failure(ErrorKind::Usage, "Usage: grep <pattern> <file>");

        const std::string& pattern = args[0];
        const std::string& file    = args[1];

        std::string content;
        try
        {
            content = read_text_file(s.resolve(file), file, "");
        }
        catch (const command_error& error)
        {
            if (error.get_kind() == ErrorKind::NotFound) throw;
            throw command_error(error.get_kind(), std::string("Error in grep: ") + error.what());
        }

        std::vector<std::string> results;
        std::istringstream       in(content);
        std::string              line;
        for (size_t number = 1; std::getline(in, line); ++number)
        {
            if (line.find(pattern) != std::string::npos)
                results.push_back(std::to_string(number) + ": " + boost::algorithm::trim_right_copy(line));
        }

        if (results.empty()) return Outcome::success("No matches found for '" + pattern + "'");
        return Outcome::success(boost::algorithm::join(results, "\n"));
    }

    // --- System ---

    Outcome cmd_ps() const
    {
        std::vector<std::string> lines{process_header, std::string(45, '-')};
        for (const platform::ProcessInfo& p : _system_info->processes())
            lines.push_back(format_process(p));
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    Outcome cmd_kill(const std::vector<std::string>& args) const
    {
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: kill <pid>");

        const std::optional<long long> pid = string::parse_integer(args[0]);
        if (!pid || *pid <= 0 || *pid > std::numeric_limits<pid_t>::max())
            return Outcome::failure(ErrorKind::Usage, "Invalid PID: must be a number");

        if (::kill(static_cast<pid_t>(*pid), SIGTERM) != 0)
        {
            const int error = errno;
            if (error == ESRCH) return Outcome::failure(ErrorKind::NotFound, "No such process: " + args[0]);
            if (error == EPERM) return Outcome::failure(ErrorKind::PermissionDenied, "Access denied: cannot kill process " + args[0]);
            return Outcome::failure(ErrorKind::Io, std::string("Error killing process: ") + std::strerror(error));
        }
        return Outcome::success("Process " + std::to_string(*pid) + " terminated");
    }

    Outcome cmd_top() const
    {
        const auto interval = _config.top_sample_interval;

        auto cpu = std::async(std::launch::async, [this, interval]
                              { return _system_info->cpu_percent(interval); });
        std::vector<platform::ProcessInfo> processes = _system_info->sample_processes(interval);

        const platform::MemoryInfo memory = _system_info->memory();
        const platform::DiskUsage  disk   = _system_info->disk_usage("/");

        std::vector<std::string> lines{
            "System Resource Usage",
            std::string(30, '='),
            "CPU Usage: " + percent(cpu.get()) + "%",
            "Memory Usage: " + percent(memory.percent) + "% (" + gib(memory.used) + " / " + gib(memory.total) + ")",
            "Disk Usage: " + percent(disk.percent) + "% (" + gib(disk.used) + " / " + gib(disk.total) + ")",
            "",
            "Top Processes by CPU:",
            process_header,
            std::string(45, '-')};

        std::stable_sort(processes.begin(), processes.end(), [](const auto& a, const auto& b)
                         { return a.cpu_percent > b.cpu_percent; });
        if (processes.size() > _config.top_process_count) processes.resize(_config.top_process_count);

        for (const platform::ProcessInfo& p : processes)
            lines.push_back(format_process(p));
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    Outcome cmd_df() const
    {
        std::vector<std::string> lines{"Filesystem Usage", std::string(30, '=')};
        for (const platform::Partition& partition : _system_info->partitions())
        {
            try
            {
                const platform::DiskUsage usage = _system_info->disk_usage(partition.mountpoint);
                lines.push_back("Device: " + partition.device);
                lines.push_back("  Mountpoint: " + partition.mountpoint);
                lines.push_back("  File system: " + partition.fstype);
                lines.push_back("  Total: " + gib(usage.total));
                lines.push_back("  Used: " + gib(usage.used) + " (" + percent(usage.percent) + "%)");
                lines.push_back("  Free: " + gib(usage.free));
            }
            catch (const std::system_error& error)
            {
                if (is_permission_error(error.code()))
                    lines.push_back("Permission denied: " + partition.device);
                else
                    lines.push_back("Error reading " + partition.device + ": " + error.code().message());
            }
            lines.emplace_back();
        }
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    Outcome cmd_free() const
    {
        const platform::MemoryInfo m = _system_info->memory();

        const std::vector<std::string> lines{
            "Memory Usage Information",
            std::string(30, '='),
            "Total RAM: " + gib(m.total),
            "Available RAM: " + gib(m.available),
            "Used RAM: " + gib(m.used) + " (" + percent(m.percent) + "%)",
            "Free RAM: " + gib(m.free),
            "",
            "Total Swap: " + gib(m.swap_total),
            "Used Swap: " + gib(m.swap_used) + " (" + percent(m.swap_percent) + "%)",
            "Free Swap: " + gib(m.swap_free)};
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    // --- Session ---

    Outcome cmd_history(const Session& s) const
    {
        const std::vector<std::string> entries = s.history().last(_config.history_display);
        if (entries.empty()) return Outcome::success("No command history");

        std::vector<std::string> lines;
        for (size_t i = 0; i < entries.size(); ++i)
        {
            std::ostringstream ss;
            ss << std::setw(3) << (i + 1) << "  " << entries[i];
            lines.push_back(ss.str());
        }
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    Outcome cmd_alias(Session& s, const std::vector<std::string>& args) const
    {
        if (args.empty())
        {
            if (s.aliases().empty()) return Outcome::success("No aliases defined");

            std::vector<std::string> lines{"Defined aliases:"};
            for (const auto& [name, value] : s.aliases())
                lines.push_back("  " + name + " = " + value);
            return Outcome::success(boost::algorithm::join(lines, "\n"));
        }

        const std::string definition = boost::algorithm::join(args, " ");
        const size_t      eq         = definition.find('=');
        if (eq == std::string::npos) return Outcome::failure(ErrorKind::Usage, "Usage: alias name=command");

        const std::string name  = string::trim(definition.substr(0, eq));
        const std::string value = string::trim(definition.substr(eq + 1));
        if (name.empty()) return Outcome::failure(ErrorKind::Usage, "Usage: alias name=command");

        s.set_alias(name, value);
        return Outcome::success("Alias created: " + name + " = " + value);
    }

    Outcome cmd_env(const Session& s) const
    {
        std::vector<std::string> lines;
        for (const auto& [name, value] : s.environment())
            lines.push_back(name + "=" + value);
        std::sort(lines.begin(), lines.end());
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    Outcome cmd_set(Session& s, const std::vector<std::string>& args) const
    {
        static const std::string usage = "Usage: set VARIABLE=value";
        if (args.empty()) return Outcome::failure(ErrorKind::Usage, usage);

        const size_t eq = args[0].find('=');
        if (eq == std::string::npos || eq == 0) return Outcome::failure(ErrorKind::Usage, usage);

        const std::string name  = args[0].substr(0, eq);
        const std::string value = args[0].substr(eq + 1);

        if (!s.export_variable(name, value)) return Outcome::failure(ErrorKind::Usage, usage);
        return Outcome::success("Set " + name + "=" + value);
    }

    Outcome cmd_tree(const Session& s, const std::vector<std::string>& args) const
    {
        const fs::path path = args.empty() ? s.working_directory() : s.resolve(args[0]);

        std::error_code ec;
        if (!fs::exists(path, ec)) return Outcome::failure(ErrorKind::NotFound, "Path not found: " + path.string());
        if (!fs::is_directory(path, ec))
        {
            return Outcome::failure(ErrorKind::Io, "Error building tree: " + path.string() + ": " + std::make_error_code(std::errc::not_a_directory).message());
        }

        const std::string        label = path.filename().string();
        std::vector<std::string> lines{label.empty() ? path.string() : label};
        build_tree(path, "", 0, lines);
        return Outcome::success(boost::algorithm::join(lines, "\n"));
    }

    void build_tree(const fs::path& dir, const std::string& prefix, int depth, std::vector<std::string>& lines) const
    {
        if (depth >= _config.tree_max_depth) return;

        std::error_code          ec;
        std::vector<std::string> names = list_directory(dir, ec);
        if (ec)
        {
            if (!is_permission_error(ec)) throw command_error(kind_of(ec), "Error building tree: " + dir.string() + ": " + ec.message());
            lines.push_back(prefix + "└── [Permission Denied]");
            return;
        }

        names.erase(std::remove_if(names.begin(), names.end(), [](const std::string& n)
                                   { return n[0] == '.'; }),
                    names.end());

        for (size_t i = 0; i < names.size(); ++i)
        {
            const bool is_last = i + 1 == names.size();
            lines.push_back(prefix + (is_last ? "└── " : "├── ") + names[i]);

            std::error_code dir_ec;
            if (fs::is_directory(dir / names[i], dir_ec))
                build_tree(dir / names[i], prefix + (is_last ? "    " : "│   "), depth + 1, lines);
        }
    }

    Config                                             _config;
    std::shared_ptr<platform::SystemInfo>              _system_info;
    std::vector<std::string>                           _names;
    ankerl::unordered_dense::map<std::string, Builtin> _lookup;
};

console::BuiltinRegistry::BuiltinRegistry(const Config& config, std::shared_ptr<platform::SystemInfo> system_info)
    : _pImpl(std::make_unique<Impl>(config, std::move(system_info)))
{
}

console::BuiltinRegistry::~BuiltinRegistry() = default;

std::optional<Builtin> console::BuiltinRegistry::find(const std::string& name) const
{
    return _pImpl->find(name);
}

const std::vector<std::string>& console::BuiltinRegistry::names() const
{
    return _pImpl->names();
}

Outcome console::BuiltinRegistry::invoke(Builtin builtin, Session& session, const std::vector<std::string>& args) const
{
    return _pImpl->invoke(builtin, session, args);
}

const std::string& console::BuiltinRegistry::help_text()
{
    return Impl::help_text();
}
