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
#include "engine.hpp"
#include "system_info.hpp"

#include "test_harness.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <stdexcept>
#include <system_error>

using namespace nlterm;
using namespace nlterm::console;

namespace
{
    class FakeSystemInfo final : public platform::SystemInfo
    {
    public:
        std::vector<platform::ProcessInfo> processes() const override
        {
            return {{1, "init", 0.0, 0.5}, {42, "worker", 12.5, 3.3}, {7, "idle", 1.0, 0.1}};
        }

        std::vector<platform::ProcessInfo> sample_processes(std::chrono::milliseconds) const override
        {
            return processes();
        }

        double cpu_percent(std::chrono::milliseconds) const override { return 17.5; }

        platform::MemoryInfo memory() const override
        {
            platform::MemoryInfo m;
            m.total        = 16 * platform::GiB;
            m.available    = 10 * platform::GiB;
            m.used         = 5 * platform::GiB + 1;
            m.free         = 6 * platform::GiB;
            m.percent      = 37.5;
            m.swap_total   = 2 * platform::GiB;
            m.swap_used    = 0;
            m.swap_free    = 2 * platform::GiB;
            m.swap_percent = 0;
            return m;
        }

        std::vector<platform::Partition> partitions() const override
        {
            return {{"/dev/sda1", "/", "ext4"}, {"/dev/sdb1", "/secret", "xfs"}};
        }

        platform::DiskUsage disk_usage(const std::string& path) const override
        {
            if (broken_disk) throw std::system_error(std::make_error_code(std::errc::io_error), "statvfs");
            if (path == "/secret") throw std::system_error(std::make_error_code(std::errc::permission_denied), "statvfs");
            return {100 * platform::GiB, 40 * platform::GiB, 60 * platform::GiB, 40.0};
        }

        bool broken_disk = false;
    };

    Config test_config(const TempDirectory& dir)
    {
        Config config;
        config.start_directory  = dir.path();
        config.external_timeout = std::chrono::seconds(5);
        return config;
    }

    std::string run(Engine& engine, const std::string& line)
    {
        return engine.execute(line).output;
    }
}

// =============================================================================
// Line handling
// =============================================================================

TEST(blank_line_is_ignored)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    const CommandResult result = engine.execute("   ");
    ASSERT_EQ(result.output, "");
    ASSERT_EQ(result.exit_code, 0);
    ASSERT(engine.history(10).empty());
}

TEST(history_records_every_line)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    engine.execute("echo one");
    engine.execute("echo 'unbalanced");
    engine.execute("nonexistent_cmd_xyz");

    ASSERT_EQ(engine.history(10), (std::vector<std::string>{"echo one", "echo 'unbalanced", "nonexistent_cmd_xyz"}));
    ASSERT_EQ(run(engine, "history"), "  1  echo one\n  2  echo 'unbalanced\n  3  nonexistent_cmd_xyz\n  4  history");
}

TEST(parse_error_is_reported)
{
    TempDirectory       dir;
    Engine              engine(test_config(dir));
    const CommandResult result = engine.execute("echo 'oops");
    ASSERT_EQ(result.output, "Command parsing error: No closing quotation");
    ASSERT_EQ(result.exit_code, 1);
}

TEST(chain_stops_at_first_failure)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    CommandResult result = engine.execute("echo a && echo b");
    ASSERT_EQ(result.output, "a\nb");
    ASSERT_EQ(result.exit_code, 0);

    result = engine.execute("nonexistent_cmd_xyz && echo b");
    ASSERT_EQ(result.output, "Command not found: nonexistent_cmd_xyz");
    ASSERT_EQ(result.exit_code, 127);

    ASSERT_EQ(run(engine, "echo '&&'"), "&&");
    ASSERT_EQ(run(engine, "echo a && && echo b"), "Command parsing error: Empty command in '&&' chain");
}

TEST(chain_with_exit_ends_session)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));
    ASSERT_EQ(run(engine, "echo bye && exit"), exit_sentinel);
}

// =============================================================================
// Aliases and wildcards
// =============================================================================

TEST(alias_is_substituted_once)
{
    TempDirectory dir;
    dir.write(".hidden", "");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "alias"), "No aliases defined");
    ASSERT_EQ(run(engine, "alias ls=ls -a"), "Alias created: ls = ls -a");
    ASSERT_EQ(run(engine, "ls"), ".hidden");
    ASSERT_EQ(run(engine, "alias"), "Defined aliases:\n  ls = ls -a");

    run(engine, "alias x=x");
    const CommandResult result = engine.execute("x");
    ASSERT_EQ(result.output, "Command not found: x");
    ASSERT_EQ(result.exit_code, 127);

    ASSERT_EQ(run(engine, "alias nothing"), "Usage: alias name=command");
}

TEST(wildcard_expands_to_sorted_matches)
{
    TempDirectory dir;
    for (const char* name : {"b.py", "a.py", "c.txt", ".h.py"})
        dir.write(name, "");
    fs::create_directory(dir.path() / "sub");
    dir.write("sub/z.py", "");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "echo *.py"), "a.py b.py");
    ASSERT_EQ(run(engine, "echo '*.py'"), "*.py");
    ASSERT_EQ(run(engine, "echo *.none"), "*.none");
    ASSERT_EQ(run(engine, "echo .*.py"), ".h.py");
    ASSERT_EQ(run(engine, "echo sub/*.py"), "sub/z.py");
}

TEST(quoted_wildcards_stay_literal_in_mixed_words)
{
    TempDirectory dir;
    dir.write("[x]1", "");
    dir.write("x1", "");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "echo '[x]'*"), "[x]1");
    ASSERT_EQ(run(engine, "echo x\\*"), "x*");
    ASSERT_EQ(run(engine, "echo \"x\"?"), "x1");
}

// =============================================================================
// File system builtins
// =============================================================================

TEST(touch_then_ls)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    ASSERT_EQ(run(engine, "ls"), "Directory is empty");
    ASSERT_EQ(run(engine, "touch a.txt"), "Touched: a.txt");
    ASSERT_EQ(run(engine, "ls"), "a.txt");
    ASSERT(fs::exists(dir.path() / "a.txt"));

    const std::string long_line = run(engine, "ls -l");
    ASSERT(long_line[0] == '-');
    ASSERT(boost::algorithm::ends_with(long_line, " a.txt"));

    ASSERT_EQ(run(engine, "ls missing"), "Path not found: missing");
    ASSERT_EQ(run(engine, "dir a.txt"), "a.txt");
}

TEST(mkdir_cd_pwd)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    ASSERT_EQ(run(engine, "mkdir d"), "Created directory: d");
    ASSERT_EQ(run(engine, "cd d"), "Changed directory to: " + (dir.path() / "d").string());
    ASSERT(boost::algorithm::ends_with(run(engine, "pwd"), "/d"));
    ASSERT_EQ(run(engine, "cd .."), "Changed directory to: " + dir.path().string());
    ASSERT_EQ(run(engine, "mkdir"), "Usage: mkdir <directory_name>");
}

TEST(cd_to_missing_directory_keeps_directory)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    const CommandResult result = engine.execute("cd nowhere");
    ASSERT_EQ(result.output, "Directory not found: " + (dir.path() / "nowhere").string());
    ASSERT_EQ(result.exit_code, 0);
    ASSERT_EQ(run(engine, "pwd"), dir.path().string());
}

TEST(cd_without_argument_goes_home)
{
    TempDirectory dir;
    fs::create_directory(dir.path() / "home");
    Engine engine(test_config(dir));

    engine.session().set_variable("HOME", (dir.path() / "home").string());
    ASSERT_EQ(run(engine, "cd"), "Changed directory to: " + (dir.path() / "home").string());
    ASSERT_EQ(run(engine, "cd ~"), "Changed directory to: " + (dir.path() / "home").string());
}

TEST(rm_refuses_directories_without_recursive_flag)
{
    TempDirectory dir;
    fs::create_directories(dir.path() / "d" / "inner");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "rm d"), "Cannot remove directory d: use -r flag");
    ASSERT_EQ(run(engine, "rm -f d"), "Cannot remove directory d: use -r flag");
    ASSERT(fs::exists(dir.path() / "d"));

    ASSERT_EQ(run(engine, "rm d -r"), "Removed directory tree: d");
    ASSERT(!fs::exists(dir.path() / "d"));
}

TEST(rm_files_and_force)
{
    TempDirectory dir;
    dir.write("a", "x");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "rm a missing"), "Removed file: a\nFile not found: missing");
    ASSERT_EQ(run(engine, "rm -f missing"), "");
    ASSERT_EQ(run(engine, "rm -r"), "No files specified");
    ASSERT_EQ(run(engine, "del"), "Usage: rm [-r] <file_or_directory>");
}

TEST(rmdir_only_removes_empty_directories)
{
    TempDirectory dir;
    fs::create_directories(dir.path() / "full" / "x");
    fs::create_directory(dir.path() / "empty");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "rmdir empty"), "Removed directory: empty");
    ASSERT_EQ(run(engine, "rmdir empty"), "Directory not found: empty");
    ASSERT(boost::algorithm::starts_with(run(engine, "rmdir full"), "Error removing full: "));
}

TEST(cat_files)
{
    TempDirectory dir;
    dir.write("a.txt", "alpha\n");
    dir.write("b.txt", "beta");
    dir.write("bin", std::string("\xff\xfe\x01", 3));
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "cat b.txt"), "beta");
    ASSERT_EQ(run(engine, "type a.txt b.txt"), "==> a.txt <==\nalpha\n\n==> b.txt <==\nbeta");
    ASSERT_EQ(run(engine, "cat bin"), "Cannot display binary file: bin");
    ASSERT_EQ(run(engine, "cat none"), "File not found: none");
    ASSERT_EQ(run(engine, "cat"), "Usage: cat <filename>");
}

TEST(cp_and_mv)
{
    TempDirectory dir;
    dir.write("a.txt", "alpha");
    fs::create_directories(dir.path() / "tree" / "leaf");
    fs::create_directory(dir.path() / "backup");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "cp a.txt b.txt"), "Copied file: a.txt -> b.txt");
    ASSERT(fs::exists(dir.path() / "b.txt"));
    ASSERT_EQ(run(engine, "cp tree t2"), "Cannot copy directory tree: use -r flag");
    ASSERT_EQ(run(engine, "cp -r tree t2"), "Copied directory tree: tree -> t2");
    ASSERT(fs::is_directory(dir.path() / "t2" / "leaf"));
    ASSERT_EQ(run(engine, "cp a.txt b.txt backup"), "Copied file: a.txt -> backup\nCopied file: b.txt -> backup");
    ASSERT(fs::exists(dir.path() / "backup" / "b.txt"));
    ASSERT_EQ(run(engine, "cp a.txt b.txt c.txt"), "Target is not a directory: c.txt");
    ASSERT_EQ(run(engine, "cp none x"), "Source not found: none");
    ASSERT_EQ(run(engine, "cp a.txt"), "Usage: cp [-r] <source> <destination>");

    ASSERT_EQ(run(engine, "mv b.txt c.txt"), "Moved: b.txt -> c.txt");
    ASSERT(!fs::exists(dir.path() / "b.txt"));
    ASSERT_EQ(run(engine, "move c.txt backup"), "Moved: c.txt -> backup");
    ASSERT(fs::exists(dir.path() / "backup" / "c.txt"));
    ASSERT_EQ(run(engine, "mv none x"), "Source not found: none");
    ASSERT_EQ(run(engine, "mv x"), "Usage: mv <source> <destination>");
}

TEST(find_walks_directories_first)
{
    TempDirectory dir;
    fs::create_directories(dir.path() / "src" / "lib");
    dir.write("src/main.py", "");
    dir.write("src/lib/util.py", "");
    dir.write("readme.md", "");
    Engine engine(test_config(dir));

    const std::string root = dir.path().string();
    ASSERT_EQ(run(engine, "find . -name *.py"), root + "/src/main.py\n" + root + "/src/lib/util.py");
    ASSERT_EQ(run(engine, "find . -type d"), root + "/src\n" + root + "/src/lib");
    ASSERT_EQ(run(engine, "find . -name *.none"), "No matches found");
    ASSERT_EQ(run(engine, "find"), "Usage: find <path> -name <pattern>");

    ASSERT_EQ(run(engine, "find src -name *.py -delete"), "Deleted: " + root + "/src/lib/util.py\nDeleted: " + root + "/src/main.py");
    ASSERT(!fs::exists(dir.path() / "src" / "main.py"));
    ASSERT(fs::exists(dir.path() / "src" / "lib"));
}

TEST(find_delete_keeps_unmatched_entries)
{
    TempDirectory dir;
    fs::create_directory(dir.path() / "tmpdir");
    fs::create_directory(dir.path() / "tmpempty");
    dir.write("tmpdir/keep.txt", "data");
    Engine engine(test_config(dir));

    const std::string root = dir.path().string();
    ASSERT_EQ(run(engine, "find . -name \"tmp*\" -delete"),
              "Deleted: " + root + "/tmpempty\n"
              "Error removing " + root + "/tmpdir: " + std::make_error_code(std::errc::directory_not_empty).message());
    ASSERT(fs::exists(dir.path() / "tmpdir" / "keep.txt"));
    ASSERT(!fs::exists(dir.path() / "tmpempty"));
}

TEST(grep_reports_line_numbers)
{
    TempDirectory dir;
    dir.write("log.txt", "one\nerror: two  \nthree\nerror again\n");
    Engine engine(test_config(dir));

    ASSERT_EQ(run(engine, "grep error log.txt"), "2: error: two\n4: error again");
    ASSERT_EQ(run(engine, "grep nothing log.txt"), "No matches found for 'nothing'");
    ASSERT_EQ(run(engine, "grep x none.txt"), "File not found: none.txt");
    ASSERT_EQ(run(engine, "grep x"), "Usage: grep <pattern> <file>");
}

TEST(tree_marks_last_visible_entry)
{
    TempDirectory dir;
    fs::create_directories(dir.path() / "a" / "inner");
    dir.write("b.txt", "");
    dir.write(".zz", "");
    Engine engine(test_config(dir));

    const std::string expected = dir.path().filename().string() + "\n"
                                 "├── a\n"
                                 "│   └── inner\n"
                                 "└── b.txt";
    ASSERT_EQ(run(engine, "tree"), expected);
    ASSERT_EQ(run(engine, "tree none"), "Path not found: " + (dir.path() / "none").string());
}

TEST(tree_on_file_is_reported)
{
    TempDirectory dir;
    dir.write("f.txt", "");
    Engine engine(test_config(dir));

    const CommandResult result = engine.execute("tree f.txt");
    ASSERT_EQ(result.output, "Error building tree: " + (dir.path() / "f.txt").string() + ": " + std::make_error_code(std::errc::not_a_directory).message());
    ASSERT_EQ(result.exit_code, 0);
}

// =============================================================================
// System and utility builtins
// =============================================================================

TEST(process_listing)
{
    TempDirectory dir;
    Engine        engine(test_config(dir), std::make_shared<FakeSystemInfo>());

    const std::string ps = run(engine, "ps");
    ASSERT(boost::algorithm::starts_with(ps, "PID   NAME                     CPU%   MEM%\n" + std::string(45, '-') + "\n"));
    const std::string row = "42   " + std::string(" ") + "worker" + std::string(14, ' ') + " " + "12.5  " + " " + "3.3   ";
    ASSERT_CONTAINS(ps, row);
}

TEST(top_sorts_by_cpu)
{
    TempDirectory dir;
    Config        config       = test_config(dir);
    config.top_process_count   = 2;
    config.top_sample_interval = std::chrono::milliseconds(1);
    Engine engine(config, std::make_shared<FakeSystemInfo>());

    const std::string top = run(engine, "top");
    ASSERT_CONTAINS(top, "CPU Usage: 17.5%");
    ASSERT_CONTAINS(top, "Memory Usage: 37.5% (5.0GB / 16.0GB)");
    ASSERT_CONTAINS(top, "Disk Usage: 40.0% (40.0GB / 100.0GB)");
    ASSERT(top.find("worker") < top.find("idle"));
    ASSERT(top.find("init") == std::string::npos);
}

TEST(unexpected_failure_is_caught_at_boundary)
{
    TempDirectory dir;
    auto          info         = std::make_shared<FakeSystemInfo>();
    info->broken_disk          = true;
    Config config              = test_config(dir);
    config.top_sample_interval = std::chrono::milliseconds(1);
    Engine engine(config, info);

    const CommandResult result = engine.execute("top");
    ASSERT(boost::algorithm::starts_with(result.output, "Error executing top: "));
    ASSERT_EQ(result.exit_code, 1);
}

TEST(df_reports_denied_partitions_inline)
{
    TempDirectory dir;
    Engine        engine(test_config(dir), std::make_shared<FakeSystemInfo>());

    const std::string df = run(engine, "df");
    ASSERT_CONTAINS(df, "Device: /dev/sda1\n  Mountpoint: /\n  File system: ext4\n  Total: 100.0GB\n  Used: 40.0GB (40.0%)\n  Free: 60.0GB");
    ASSERT_CONTAINS(df, "Permission denied: /dev/sdb1");
}

TEST(free_reports_whole_gib)
{
    TempDirectory dir;
    Engine        engine(test_config(dir), std::make_shared<FakeSystemInfo>());

    const std::string free = run(engine, "free");
    ASSERT_CONTAINS(free, "Total RAM: 16.0GB");
    ASSERT_CONTAINS(free, "Used RAM: 5.0GB (37.5%)");
    ASSERT_CONTAINS(free, "Free Swap: 2.0GB");
}

TEST(kill_validates_pid)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    CommandResult result = engine.execute("kill abc");
    ASSERT_EQ(result.output, "Invalid PID: must be a number");
    ASSERT_EQ(result.exit_code, 0);
    ASSERT_EQ(run(engine, "kill"), "Usage: kill <pid>");
    ASSERT_EQ(run(engine, "kill 999999999"), "No such process: 999999999");
}

TEST(strict_exit_codes)
{
    TempDirectory dir;
    Config        config     = test_config(dir);
    config.strict_exit_codes = true;
    Engine engine(config);

    ASSERT_EQ(engine.execute("kill abc").exit_code, 2);
    ASSERT_EQ(engine.execute("cat missing").exit_code, 1);
    ASSERT_EQ(engine.execute("echo fine").exit_code, 0);
}

TEST(simple_builtins)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    ASSERT_EQ(run(engine, "echo hello   world"), "hello world");
    ASSERT_EQ(run(engine, "clear"), clear_sequence);
    ASSERT_EQ(run(engine, "cls"), clear_sequence);
    ASSERT_EQ(run(engine, "exit"), exit_sentinel);
    ASSERT_EQ(run(engine, "quit"), exit_sentinel);
    ASSERT_EQ(run(engine, "help"), BuiltinRegistry::help_text());
    ASSERT_EQ(run(engine, "date").size(), 19u);

    ASSERT_EQ(run(engine, "set NLTERM_TEST_VAR=42"), "Set NLTERM_TEST_VAR=42");
    ASSERT_CONTAINS(run(engine, "env"), "NLTERM_TEST_VAR=42");
    ASSERT_EQ(run(engine, "set NOPE"), "Usage: set VARIABLE=value");

    run(engine, "set USER=tester");
    ASSERT_EQ(run(engine, "whoami"), "tester");
}

TEST(prompt_shows_user_host_and_directory)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));
    engine.session().set_variable("USER", "tester");
    engine.session().set_variable("HOSTNAME", "box");

    ASSERT_EQ(engine.prompt(), "tester@box:" + dir.path().filename().string() + "$ ");
    run(engine, "cd /");
    ASSERT_EQ(engine.prompt(), "tester@box:/$ ");
}

// =============================================================================
// External commands
// =============================================================================

TEST(external_command_output_and_status)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));

    const CommandResult result = engine.execute("sh -c 'echo out; echo err 1>&2; exit 3'");
    ASSERT_EQ(result.output, "out\nerr\n");
    ASSERT_EQ(result.exit_code, 3);
}

TEST(external_command_runs_in_session_directory)
{
    TempDirectory dir;
    fs::create_directory(dir.path() / "work");
    Engine engine(test_config(dir));

    run(engine, "cd work");
    ASSERT_EQ(run(engine, "sh -c pwd"), (dir.path() / "work").string() + "\n");

    run(engine, "set NLTERM_CHILD=visible");
    ASSERT_EQ(run(engine, "sh -c 'echo $NLTERM_CHILD'"), "visible\n");
}

TEST(nonexistent_command)
{
    TempDirectory       dir;
    Engine              engine(test_config(dir));
    const CommandResult result = engine.execute("nonexistent_cmd_xyz");
    ASSERT_EQ(result.output, "Command not found: nonexistent_cmd_xyz");
    ASSERT_EQ(result.exit_code, 127);
}

TEST(external_command_killed_by_signal)
{
    TempDirectory dir;
    Engine        engine(test_config(dir));
    ASSERT_EQ(engine.execute("sh -c 'kill -TERM $$'").exit_code, 128 + 15);
}

TEST(external_command_times_out)
{
    TempDirectory dir;
    Config        config    = test_config(dir);
    config.external_timeout = std::chrono::seconds(1);
    Engine engine(config);

    const CommandResult result = engine.execute("sleep 10");
    ASSERT_EQ(result.output, "Command timed out after 1 seconds");
    ASSERT_EQ(result.exit_code, 1);
}

TEST(timeout_must_be_in_range)
{
    TempDirectory dir;
    for (const auto timeout : {std::chrono::seconds(0), max_external_timeout + std::chrono::seconds(1), std::chrono::seconds(std::chrono::hours(1000000))})
    {
        Config config           = test_config(dir);
        config.external_timeout = timeout;

        bool thrown = false;
        try
        {
            Engine engine(config);
        }
        catch (const std::invalid_argument&)
        {
            thrown = true;
        }
        ASSERT(thrown);
    }
}

// =============================================================================
// Completion
// =============================================================================

TEST(completion)
{
    TempDirectory dir;
    fs::create_directory(dir.path() / "src");
    dir.write("setup.py", "");
    Engine engine(test_config(dir));

    ASSERT_EQ(engine.complete("ec", "ec"), (std::vector<std::string>{"echo"}));
    ASSERT_EQ(engine.complete("gi", "gi"), (std::vector<std::string>{"git"}));
    ASSERT_EQ(engine.complete("s", "cat s"), (std::vector<std::string>{"setup.py", "src/"}));
    ASSERT_EQ(engine.complete("", "ls "), (std::vector<std::string>{"setup.py", "src/"}));
    ASSERT_EQ(engine.complete("src/", "ls src/"), std::vector<std::string>{});
    ASSERT(engine.complete("", "").size() == 10u);
    ASSERT(engine.complete("x", "ls missing/x").empty());
}

int main()
{
    run_test_blank_line_is_ignored();
    run_test_history_records_every_line();
    run_test_parse_error_is_reported();
    run_test_chain_stops_at_first_failure();
    run_test_chain_with_exit_ends_session();
    run_test_alias_is_substituted_once();
    run_test_wildcard_expands_to_sorted_matches();
    run_test_quoted_wildcards_stay_literal_in_mixed_words();
    run_test_touch_then_ls();
    run_test_mkdir_cd_pwd();
    run_test_cd_to_missing_directory_keeps_directory();
    run_test_cd_without_argument_goes_home();
    run_test_rm_refuses_directories_without_recursive_flag();
    run_test_rm_files_and_force();
    run_test_rmdir_only_removes_empty_directories();
    run_test_cat_files();
    run_test_cp_and_mv();
    run_test_find_walks_directories_first();
    run_test_find_delete_keeps_unmatched_entries();
    run_test_grep_reports_line_numbers();
    run_test_tree_marks_last_visible_entry();
    run_test_tree_on_file_is_reported();
    run_test_process_listing();
    run_test_top_sorts_by_cpu();
    run_test_unexpected_failure_is_caught_at_boundary();
    run_test_df_reports_denied_partitions_inline();
    run_test_free_reports_whole_gib();
    run_test_kill_validates_pid();
    run_test_strict_exit_codes();
    run_test_simple_builtins();
    run_test_prompt_shows_user_host_and_directory();
    run_test_external_command_output_and_status();
    run_test_external_command_runs_in_session_directory();
    run_test_nonexistent_command();
    run_test_external_command_killed_by_signal();
    run_test_external_command_times_out();
    run_test_timeout_must_be_in_range();
    run_test_completion();
    return report_results();
}
