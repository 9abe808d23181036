//
// Created by gregorian-rayne on 2/16/26.
//

#include "bfa/cli/commands/command.hpp"
#include "bfa/cli/progress.hpp"
#include "bfa/cli/formatter.hpp"

#include "bfa/bfa.hpp"

#include <iostream>
#include <filesystem>
#include <sstream>

namespace bfa::cli
{
    namespace fs = std::filesystem;

    /**
     * Bus factor command. One instance is registered per calculation method.
     */
    class BusFactorCommand : public Command {
    public:
        BusFactorCommand(const methods::IBusFactorMethod& method, std::string description)
            : method_(std::string(method.name()))
            , description_(std::move(description))
            , needs_history_(method.needs_history()) {}

        [[nodiscard]] std::string_view name() const noexcept override {
            return method_;
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return description_;
        }

        [[nodiscard]] std::string usage() const override {
            std::ostringstream ss;
            ss << "Usage: bfa " << method_ << " [OPTIONS] <repo-path>\n"
               << "       bfa " << method_ << " [OPTIONS] --input <authorship.json>\n"
               << "\n"
               << "Examples:\n"
               << "  bfa " << method_ << " ~/src/project\n"
               << "  bfa " << method_ << " --json --output report.json .\n"
               << "  bfa " << method_ << " -q .";
            return ss.str();
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"input", 'i', "Read authorship from a JSON file instead of git", false, true, "", "FILE"},
                {"output", 'o', "Write the JSON report to a file", false, true, "", "FILE"},
                {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
                {"summary", 's', "Show only summary information", false, false, "", ""},
                {"threshold", 't', "Ownerless ratio to exceed (0-1)", false, true, "", "RATIO"},
                {"top", 'n', "Number of top contributors to list", false, true, "", "N"},
                {"decay-rate", 0, "Knowledge decay rate per year", false, true, "", "RATE"},
                {"window-days", 0, "Commit history window in days", false, true, "", "DAYS"},
                {"threads", 0, "Threads for history retrieval (0=auto)", false, true, "", "N"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.has("input") && !args.positional().empty()) {
                return "Specify either a repository path or --input, not both";
            }
            if (args.positional().size() > 1) {
                return "Only one repository path can be analyzed at a time";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            auto config = build_config(args);
            if (config.is_err()) {
                return fail(config.error());
            }

            const Timestamp now = std::chrono::system_clock::now();
            CliObserver observer(*this);

            auto input = args.has("input")
                ? load_input(*args.get("input"))
                : collect_input(repo_path(args), config.value(), now, observer);
            if (input.is_err()) {
                return fail(input.error());
            }

            if (const auto& errors = input.value().authorship.errors; !errors.empty()) {
                print_warning(std::to_string(errors.size()) + " file(s) could not be fully analyzed");
            }

            auto report = methods::run_analysis(
                method_, input.value(), methods::RunContext{config.value(), now}, observer
            );
            if (report.is_err()) {
                return fail(report.error());
            }

            return emit(report.value(), args);
        }

    private:
        /**
         * Forwards analysis events to the command's output helpers.
         */
        class CliObserver final : public IAnalysisObserver {
        public:
            explicit CliObserver(const BusFactorCommand& cmd) : cmd_(cmd) {}

            void on_start(const std::string_view method, const std::size_t total_files) override {
                cmd_.print_verbose("Running " + std::string(method) + " on " +
                                   std::to_string(total_files) + " files");
            }

            void on_info(const std::string_view message) override {
                cmd_.print_verbose(message);
            }

            void on_warning(const std::string_view message) override {
                cmd_.print_debug(message);
            }

            void on_file_processed(const FileProgress& progress) override {
                if (cmd_.is_quiet()) {
                    return;
                }
                if (!bar_) {
                    const std::string label = progress.phase == "history" ? "History" : "Blame";
                    bar_ = std::make_unique<ScopedProgress>(progress.total, label);
                }
                bar_->set_message(format_path(progress.file, 40));
                bar_->update(progress.processed);
                if (progress.processed >= progress.total) {
                    bar_.reset();
                }
            }

            void on_removal(const RemovalStep& step, const std::size_t total_files) override {
                cmd_.print_verbose("  removed " + step.author + " (DOA " +
                                   report::format_percentage(step.doa) + "%): " +
                                   std::to_string(step.ownerless_files) + "/" +
                                   std::to_string(total_files) + " files ownerless");
            }

            void on_complete(const RemovalResult& result) override {
                cmd_.print_verbose("Bus factor: " + std::to_string(result.bus_factor));
            }

        private:
            const BusFactorCommand& cmd_;
            std::unique_ptr<ScopedProgress> bar_;
        };

        static fs::path repo_path(const ParsedArgs& args) {
            return args.positional().empty() ? fs::path(".") : fs::path(args.positional().front());
        }

        [[nodiscard]] Result<AnalysisConfig, Error> build_config(const ParsedArgs& args) const {
            AnalysisConfig config;

            if (const auto path = args.get("config")) {
                auto loaded = load_config_file(*path);
                if (loaded.is_err()) {
                    return loaded;
                }
                config = loaded.value();
                print_verbose("Loaded configuration from " + *path);
            }

            auto invalid = [](const std::string& option, const std::string& value) {
                return Result<AnalysisConfig, Error>::failure(
                    Error::invalid_argument("Invalid value for --" + option, value)
                );
            };

            if (args.has("decay-rate")) {
                const auto value = args.get_double("decay-rate");
                if (!value) return invalid("decay-rate", args.get_or("decay-rate", ""));
                config.decay_rate = *value;
            }
            if (args.has("window-days")) {
                const auto value = args.get_int("window-days");
                if (!value) return invalid("window-days", args.get_or("window-days", ""));
                config.window_days = *value;
            }
            if (args.has("threshold")) {
                const auto value = args.get_double("threshold");
                if (!value) return invalid("threshold", args.get_or("threshold", ""));
                config.threshold = *value;
            }
            if (args.has("top")) {
                const auto value = args.get_int("top");
                if (!value || *value < 0) return invalid("top", args.get_or("top", ""));
                config.top_contributors = static_cast<std::size_t>(*value);
            }
            if (args.has("threads")) {
                const auto value = args.get_int("threads");
                if (!value || *value < 0) return invalid("threads", args.get_or("threads", ""));
                config.history_threads = static_cast<unsigned int>(*value);
            }

            if (auto valid = config.validate(); valid.is_err()) {
                return Result<AnalysisConfig, Error>::failure(valid.error());
            }
            return Result<AnalysisConfig, Error>::success(config);
        }

        [[nodiscard]] Result<AnalysisInput, Error> load_input(const std::string& path) const {
            print_verbose("Reading authorship from " + path);
            return io::load_authorship_json(path);
        }

        [[nodiscard]] Result<AnalysisInput, Error> collect_input(
            const fs::path& repo,
            const AnalysisConfig& config,
            const Timestamp now,
            IAnalysisObserver& observer
        ) const {
            if (std::error_code ec; !fs::is_directory(repo, ec)) {
                return Result<AnalysisInput, Error>::failure(
                    Error::not_found("Repository path does not exist", repo.string())
                );
            }
            if (!git::is_git_repository(repo)) {
                return Result<AnalysisInput, Error>::failure(
                    Error::git_error("Not a git repository", repo.string())
                );
            }

            auto files = git::list_tracked_files(repo);
            if (files.is_err()) {
                return Result<AnalysisInput, Error>::failure(files.error());
            }
            print_verbose("Found " + std::to_string(files.value().size()) + " files to analyze");

            const auto blame = git::create_blame_source(repo);
            AnalysisInput input;
            input.authorship = git::collect_authorship(*blame, files.value(), observer);
            input.authorship.repo_path = repo;

            if (needs_history_) {
                const auto source = git::create_history_source(repo);
                auto history = git::collect_history(
                    *source, files.value(), config.window_days, now, config.history_threads, observer
                );
                input.history = std::move(history.history);
                for (auto& error : history.errors) {
                    input.authorship.errors.push_back(std::move(error));
                }
            }

            return Result<AnalysisInput, Error>::success(std::move(input));
        }

        [[nodiscard]] int emit(const report::Report& result, const ParsedArgs& args) const {
            const auto document = report::to_json(result);

            if (is_json()) {
                std::cout << json_utils::to_string(document, is_quiet() ? -1 : 2) << "\n";
            } else if (is_quiet()) {
                std::cout << result.summary.bus_factor << "\n";
            } else {
                ReportPrinter printer(std::cout);
                printer.print(result, args.get_flag("summary"));
            }

            if (const auto output = args.get("output")) {
                if (auto written = json_utils::write_file(*output, document); written.is_err()) {
                    return fail(written.error());
                }
                print_verbose("Report written to " + *output);
            }

            return 0;
        }

        [[nodiscard]] int fail(const Error& error) const {
            if (is_quiet() && is_json()) {
                std::cout << json_utils::to_string({{"error", error.to_string()}}) << "\n";
            } else {
                print_error(error.to_string());
            }
            return 1;
        }

        std::string method_;
        std::string description_;
        bool needs_history_ = false;
    };

    /**
     * Lists the registered calculation methods.
     */
    class MethodsCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "methods";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List available bus factor calculation methods";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            const auto methods = methods::MethodRegistry::instance().list();

            if (is_json()) {
                auto list = json_utils::json::array();
                for (const auto* method : methods) {
                    list.push_back({
                        {"name", std::string(method->name())},
                        {"title", std::string(method->title())},
                        {"description", std::string(method->description())}
                    });
                }
                std::cout << json_utils::to_string(list, 2) << "\n";
                return 0;
            }

            Table table({{"Name", 0, false}, {"Method", 0, false}});
            for (const auto* method : methods) {
                table.add_row({std::string(method->name()), std::string(method->title())});
            }
            table.render(std::cout);

            if (is_verbose()) {
                std::cout << "\n";
                for (const auto* method : methods) {
                    std::cout << method->name() << ": " << method->description() << "\n";
                }
            }
            return 0;
        }
    };

    namespace {
        struct BusFactorCommandRegistrar {
            BusFactorCommandRegistrar() {
                for (const auto* method : methods::MethodRegistry::instance().list()) {
                    CommandRegistry::instance().register_command(
                        std::make_unique<BusFactorCommand>(
                            *method,
                            "Calculate the bus factor: " + std::string(method->title())
                        )
                    );
                }
                CommandRegistry::instance().register_command(std::make_unique<MethodsCommand>());
            }
        } bus_factor_registrar;
    }
}  // namespace bfa::cli
