//
// Created by gregorian-rayne on 2/15/26.
//

#include "bfa/git/git_integration.hpp"

#include <charconv>
#include <cstdint>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>

namespace bfa::git
{
    namespace {

        constexpr int TIMED_OUT = -2;

        void drain(const int fd, std::string& out) {
            char buffer[4096];
            ssize_t n;
            while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
            }
        }

        Result<CommandResult, Error> execute_command_impl(
            const std::vector<std::string>& args,
            const fs::path& working_dir,
            const Duration timeout
        ) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            std::vector<char*> argv;
            argv.reserve(args.size() + 2);
            argv.push_back(const_cast<char*>("git"));
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            int stdout_pipe[2];
            int stderr_pipe[2];

            if (pipe(stdout_pipe) < 0) {
                return Result<CommandResult, Error>::failure(
                    Error::git_error("Failed to create pipe")
                );
            }
            if (pipe(stderr_pipe) < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                return Result<CommandResult, Error>::failure(
                    Error::git_error("Failed to create pipe")
                );
            }

            const pid_t pid = fork();
            if (pid < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                close(stderr_pipe[0]);
                close(stderr_pipe[1]);
                return Result<CommandResult, Error>::failure(
                    Error::git_error("Failed to start git")
                );
            }

            if (pid == 0) {
                // Child process
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);

                dup2(stdout_pipe[1], STDOUT_FILENO);
                dup2(stderr_pipe[1], STDERR_FILENO);

                close(stdout_pipe[1]);
                close(stderr_pipe[1]);

                if (chdir(working_dir.c_str()) != 0) {
                    _exit(127);
                }

                execvp("git", argv.data());
                _exit(127);
            }

            // Parent process
            close(stdout_pipe[1]);
            close(stderr_pipe[1]);

            fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
            fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

            const auto timeout_point = std::chrono::steady_clock::now() + timeout;
            int status = 0;
            bool finished = false;

            while (!finished) {
                if (std::chrono::steady_clock::now() > timeout_point) {
                    kill(pid, SIGTERM);
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    kill(pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    result.exit_code = TIMED_OUT;
                    finished = true;
                    continue;
                }

                drain(stdout_pipe[0], result.stdout_output);
                drain(stderr_pipe[0], result.stderr_output);

                if (const pid_t wpid = waitpid(pid, &status, WNOHANG); wpid > 0) {
                    drain(stdout_pipe[0], result.stdout_output);
                    drain(stderr_pipe[0], result.stderr_output);

                    if (WIFEXITED(status)) {
                        result.exit_code = WEXITSTATUS(status);
                    } else if (WIFSIGNALED(status)) {
                        result.exit_code = -WTERMSIG(status);
                    }
                    finished = true;
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
            }

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            const auto end_time = std::chrono::steady_clock::now();
            result.execution_time = std::chrono::duration_cast<Duration>(end_time - start_time);

            return Result<CommandResult, Error>::success(std::move(result));
        }

        std::string describe(const std::vector<std::string>& args) {
            std::string text = "git";
            for (const auto& arg : args) {
                text += ' ';
                text += arg;
            }
            return text;
        }

        std::string_view trim_right(std::string_view text) {
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
                text.remove_suffix(1);
            }
            return text;
        }

        /**
         * Runs git and turns a non-zero exit into a GitError carrying stderr.
         */
        Result<std::string, Error> run_checked(
            const std::vector<std::string>& args,
            const fs::path& working_dir
        ) {
            auto result = execute_git(args, working_dir);
            if (result.is_err()) {
                return Result<std::string, Error>::failure(result.error());
            }

            auto& output = result.value();
            if (output.exit_code != 0) {
                std::string detail(trim_right(output.stderr_output));
                if (detail.empty()) {
                    detail = "exit code " + std::to_string(output.exit_code);
                }
                return Result<std::string, Error>::failure(
                    Error::git_error(describe(args) + " failed", detail)
                );
            }

            return Result<std::string, Error>::success(std::move(output.stdout_output));
        }

        class GitBlameSource final : public IBlameSource {
        public:
            explicit GitBlameSource(fs::path repo_dir)
                : repo_dir_(std::move(repo_dir)) {}

            [[nodiscard]] Result<std::vector<AuthorLines>, Error> blame(const std::string& file) const override {
                auto output = run_checked({"blame", "--line-porcelain", "--", file}, repo_dir_);
                if (output.is_err()) {
                    return Result<std::vector<AuthorLines>, Error>::failure(output.error());
                }
                return Result<std::vector<AuthorLines>, Error>::success(
                    parse_line_porcelain(output.value())
                );
            }

        private:
            fs::path repo_dir_;
        };

        class GitHistorySource final : public IHistorySource {
        public:
            explicit GitHistorySource(fs::path repo_dir)
                : repo_dir_(std::move(repo_dir)) {}

            [[nodiscard]] Result<std::vector<CommitRecord>, Error> history(
                const std::string& file,
                const Timestamp since
            ) const override {
                const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                    since.time_since_epoch()
                ).count();

                auto output = run_checked(
                    {"log", "--since=@" + std::to_string(epoch), "--pretty=format:%H|%an|%at", "--", file},
                    repo_dir_
                );
                if (output.is_err()) {
                    return Result<std::vector<CommitRecord>, Error>::failure(output.error());
                }
                return Result<std::vector<CommitRecord>, Error>::success(
                    parse_log_records(output.value())
                );
            }

        private:
            fs::path repo_dir_;
        };

    }  // namespace

    // =============================================================================
    // Core Git Functions
    // =============================================================================

    Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const Duration timeout
    ) {
        if (std::error_code ec; !fs::is_directory(working_dir, ec)) {
            return Result<CommandResult, Error>::failure(
                Error::not_found("Working directory not found", working_dir.string())
            );
        }

        auto result = execute_command_impl(args, working_dir, timeout);
        if (result.is_err()) {
            return result;
        }

        if (result.value().exit_code == TIMED_OUT) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Git command timed out", describe(args))
            );
        }

        return result;
    }

    bool is_git_repository(const fs::path& dir) {
        auto result = execute_git(
            {"rev-parse", "--is-inside-work-tree"},
            dir,
            std::chrono::seconds(5)
        );
        return result.is_ok()
            && result.value().exit_code == 0
            && trim_right(result.value().stdout_output) == "true";
    }

    Result<std::vector<std::string>, Error> list_tracked_files(const fs::path& repo_dir) {
        auto output = run_checked({"ls-files", "-z"}, repo_dir);
        if (output.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(output.error());
        }

        std::vector<std::string> files;
        std::string_view rest = output.value();
        while (!rest.empty()) {
            const auto end = rest.find('\0');
            const auto name = rest.substr(0, end);
            if (!name.empty()) {
                files.emplace_back(name);
            }
            if (end == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(end + 1);
        }

        return Result<std::vector<std::string>, Error>::success(std::move(files));
    }

    // =============================================================================
    // Output Parsers
    // =============================================================================

    std::vector<AuthorLines> parse_line_porcelain(const std::string_view output) {
        std::vector<AuthorLines> authors;
        std::string current_author;
        bool has_author = false;

        std::size_t pos = 0;
        while (pos < output.size()) {
            auto end = output.find('\n', pos);
            if (end == std::string_view::npos) {
                end = output.size();
            }
            const auto line = output.substr(pos, end - pos);
            pos = end + 1;

            if (line.starts_with("author ")) {
                current_author = std::string(line.substr(7));
                has_author = true;
            } else if (line.starts_with('\t') && has_author) {
                add_lines(authors, current_author, 1.0);
            }
        }

        return authors;
    }

    std::vector<CommitRecord> parse_log_records(const std::string_view output) {
        std::vector<CommitRecord> records;

        std::size_t pos = 0;
        while (pos < output.size()) {
            auto end = output.find('\n', pos);
            if (end == std::string_view::npos) {
                end = output.size();
            }
            const auto line = trim_right(output.substr(pos, end - pos));
            pos = end + 1;

            const auto first = line.find('|');
            const auto last = line.rfind('|');
            if (first == std::string_view::npos || first == last || first == 0) {
                continue;
            }

            const auto stamp = line.substr(last + 1);
            std::int64_t seconds = 0;
            const auto [ptr, ec] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), seconds);
            if (ec != std::errc{} || ptr != stamp.data() + stamp.size() || stamp.empty()) {
                continue;
            }

            CommitRecord record;
            record.revision = std::string(line.substr(0, first));
            record.author = std::string(line.substr(first + 1, last - first - 1));
            record.timestamp = Timestamp{std::chrono::seconds{seconds}};
            records.push_back(std::move(record));
        }

        return records;
    }

    std::unique_ptr<IBlameSource> create_blame_source(const fs::path& repo_dir) {
        return std::make_unique<GitBlameSource>(repo_dir);
    }

    std::unique_ptr<IHistorySource> create_history_source(const fs::path& repo_dir) {
        return std::make_unique<GitHistorySource>(repo_dir);
    }
} // namespace bfa::git
