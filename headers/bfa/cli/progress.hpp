//
// Created by gregorian-rayne on 2/16/26.
//

#ifndef BFA_PROGRESS_HPP
#define BFA_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Progress bar for per-file git queries.
 *
 * Progress goes to stderr and is only drawn when stderr is a terminal, so
 * redirected output (JSON in particular) stays clean.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace bfa::cli
{
    /**
     * Style options for progress bars.
     */
    struct ProgressStyle {
        std::string fill_char = "█";
        std::string empty_char = "░";
        std::size_t bar_width = 30;
        bool show_percentage = true;
        bool show_count = true;
        bool show_eta = true;
    };

    /**
     * Progress bar for operations with known total.
     */
    class ProgressBar {
    public:
        explicit ProgressBar(std::size_t total, std::string_view label = "");
        ProgressBar(std::size_t total, std::string_view label, const ProgressStyle& style);
        ~ProgressBar();

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        void update(std::size_t current);
        void set_message(std::string_view msg);
        void finish();

        /**
         * Returns current progress (0.0 to 1.0).
         */
        [[nodiscard]] double progress() const;

        [[nodiscard]] std::chrono::milliseconds elapsed() const;

        /**
         * Returns estimated time remaining.
         */
        [[nodiscard]] std::chrono::milliseconds eta() const;

    private:
        void render() const;
        static void clear_line();

        std::size_t total_;
        std::size_t current_ = 0;
        std::string label_;
        std::string message_;
        ProgressStyle style_;
        std::chrono::steady_clock::time_point start_time_;
        bool finished_ = false;
        bool enabled_ = true;
    };

    /**
     * RAII wrapper for progress that auto-finishes.
     */
    class ScopedProgress {
    public:
        ScopedProgress(std::size_t total, std::string_view label);
        ~ScopedProgress();

        void update(const std::size_t current) const { bar_->update(current); }
        void set_message(const std::string_view msg) const { bar_->set_message(msg); }

    private:
        std::unique_ptr<ProgressBar> bar_;
    };

    /**
     * Checks if stdout is a TTY.
     */
    [[nodiscard]] bool is_tty();

    /**
     * Checks if stderr is a TTY.
     */
    [[nodiscard]] bool is_stderr_tty();

    /**
     * Gets terminal width.
     */
    [[nodiscard]] std::size_t terminal_width();

    /**
     * Format a duration for display.
     */
    [[nodiscard]] std::string format_duration(std::chrono::milliseconds ms);

}  // namespace bfa::cli

#endif //BFA_PROGRESS_HPP
