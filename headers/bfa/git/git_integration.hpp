//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef BFA_GIT_INTEGRATION_HPP
#define BFA_GIT_INTEGRATION_HPP

/**
 * @file git_integration.hpp
 * @brief Git access for authorship and history extraction.
 *
 * Provides:
 * - Running git with an argument vector (no shell involved)
 * - Tracked file listing
 * - Parsing of `git blame --line-porcelain` and `git log` output
 * - Blame and history sources the collector queries per file
 *
 * Only local working copies are supported.
 */

#include "bfa/result.hpp"
#include "bfa/error.hpp"
#include "bfa/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bfa::git
{
    /**
     * Output of a finished git process.
     */
    struct CommandResult {
        int exit_code = 0;
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time = Duration::zero();
    };

    /**
     * Executes git with the given arguments.
     *
     * Arguments are passed to execvp unchanged, so paths containing spaces
     * or shell metacharacters need no quoting.
     *
     * @param args Arguments after "git".
     * @param working_dir Directory to run in.
     * @param timeout Process is killed after this long.
     * @return The process output (any exit code), NotFound when the
     *         directory does not exist, GitError on timeout or spawn failure.
     */
    [[nodiscard]] Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        Duration timeout = std::chrono::seconds(60)
    );

    /**
     * Checks if a directory is inside a git working tree.
     */
    [[nodiscard]] bool is_git_repository(const fs::path& dir);

    /**
     * Lists tracked files, relative to the repository root.
     *
     * Uses `git ls-files -z` so unusual file names survive intact.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> list_tracked_files(const fs::path& repo_dir);

    /**
     * Counts lines per author in `git blame --line-porcelain` output.
     *
     * Each content line (tab-prefixed) is attributed to the author named by
     * the most recent "author " header. Authors keep first-seen order.
     */
    [[nodiscard]] std::vector<AuthorLines> parse_line_porcelain(std::string_view output);

    /**
     * Parses `git log --pretty=format:%H|%an|%at` output.
     *
     * The author name may itself contain '|'; the hash is taken up to the
     * first separator and the timestamp after the last. Malformed lines are
     * skipped.
     */
    [[nodiscard]] std::vector<CommitRecord> parse_log_records(std::string_view output);

    /**
     * Per-file line authorship.
     */
    class IBlameSource {
    public:
        virtual ~IBlameSource() = default;

        [[nodiscard]] virtual Result<std::vector<AuthorLines>, Error> blame(const std::string& file) const = 0;
    };

    /**
     * Per-file commit records since a point in time.
     */
    class IHistorySource {
    public:
        virtual ~IHistorySource() = default;

        [[nodiscard]] virtual Result<std::vector<CommitRecord>, Error> history(
            const std::string& file,
            Timestamp since
        ) const = 0;
    };

    [[nodiscard]] std::unique_ptr<IBlameSource> create_blame_source(const fs::path& repo_dir);
    [[nodiscard]] std::unique_ptr<IHistorySource> create_history_source(const fs::path& repo_dir);

} // namespace bfa::git

#endif //BFA_GIT_INTEGRATION_HPP
