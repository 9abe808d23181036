//
// Created by gregorian-rayne on 2/16/26.
//

#include "bfa/cli/progress.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>
#include <sys/ioctl.h>

namespace bfa::cli
{
    // ============================================================================
    // Terminal Utilities
    // ============================================================================

    bool is_tty() {
        return isatty(STDOUT_FILENO) != 0;
    }

    bool is_stderr_tty() {
        return isatty(STDERR_FILENO) != 0;
    }

    std::size_t terminal_width() {
        winsize w{};
        if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            return w.ws_col;
        }
        return 80;
    }

    std::string format_duration(const std::chrono::milliseconds ms) {
        const auto total_seconds = ms.count() / 1000;
        const auto hours = total_seconds / 3600;
        const auto minutes = (total_seconds % 3600) / 60;
        const auto seconds = total_seconds % 60;

        std::ostringstream ss;
        if (hours > 0) {
            ss << hours << "h " << minutes << "m " << seconds << "s";
        } else if (minutes > 0) {
            ss << minutes << "m " << seconds << "s";
        } else if (total_seconds > 0) {
            ss << seconds << "." << (ms.count() % 1000) / 100 << "s";
        } else {
            ss << ms.count() << "ms";
        }
        return ss.str();
    }

    // ============================================================================
    // ProgressBar Implementation
    // ============================================================================

    ProgressBar::ProgressBar(const std::size_t total, const std::string_view label)
        : ProgressBar(total, label, ProgressStyle{}) {}

    ProgressBar::ProgressBar(const std::size_t total, const std::string_view label, const ProgressStyle& style)
        : total_(total)
        , label_(label)
        , style_(style)
        , start_time_(std::chrono::steady_clock::now())
        , enabled_(is_stderr_tty())
    {
        if (enabled_) {
            render();
        }
    }

    ProgressBar::~ProgressBar() {
        if (!finished_) {
            finish();
        }
    }

    void ProgressBar::update(const std::size_t current) {
        current_ = std::min(current, total_);
        if (enabled_) {
            render();
        }
    }

    void ProgressBar::set_message(const std::string_view msg) {
        message_ = msg;
        if (enabled_) {
            render();
        }
    }

    void ProgressBar::finish() {
        if (finished_) return;
        finished_ = true;
        current_ = total_;
        if (enabled_) {
            clear_line();
            std::cerr << "\r" << std::flush;
        }
    }

    double ProgressBar::progress() const {
        if (total_ == 0) return 1.0;
        return static_cast<double>(current_) / static_cast<double>(total_);
    }

    std::chrono::milliseconds ProgressBar::elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

    std::chrono::milliseconds ProgressBar::eta() const {
        if (current_ == 0) return std::chrono::milliseconds{0};

        const auto elapsed_ms = elapsed().count();
        if (elapsed_ms <= 0) return std::chrono::milliseconds{0};

        const auto remaining = total_ - current_;
        const auto rate = static_cast<double>(current_) / static_cast<double>(elapsed_ms);
        return std::chrono::milliseconds{static_cast<long long>(static_cast<double>(remaining) / rate)};
    }

    void ProgressBar::render() const
    {
        clear_line();

        std::ostringstream ss;
        ss << "\r";

        if (!label_.empty()) {
            ss << label_ << " ";
        }

        ss << "[";

        const double pct = progress();
        const auto filled = static_cast<std::size_t>(pct * static_cast<double>(style_.bar_width));

        for (std::size_t i = 0; i < style_.bar_width; ++i) {
            ss << (i < filled ? style_.fill_char : style_.empty_char);
        }

        ss << "]";

        if (style_.show_percentage) {
            ss << " " << std::fixed << std::setprecision(1) << (pct * 100) << "%";
        }

        if (style_.show_count) {
            ss << " (" << current_ << "/" << total_ << ")";
        }

        if (style_.show_eta && !finished_) {
            if (const auto remaining = eta(); remaining.count() > 0) {
                ss << " ETA: " << format_duration(remaining);
            }
        }

        if (!message_.empty()) {
            ss << " " << message_;
        }

        std::cerr << ss.str() << std::flush;
    }

    void ProgressBar::clear_line() {
        std::cerr << "\r" << std::string(terminal_width() - 1, ' ') << std::flush;
    }

    // ============================================================================
    // ScopedProgress Implementation
    // ============================================================================

    ScopedProgress::ScopedProgress(const std::size_t total, const std::string_view label)
        : bar_(std::make_unique<ProgressBar>(total, label))
    {}

    ScopedProgress::~ScopedProgress() {
        bar_->finish();
    }

}  // namespace bfa::cli
