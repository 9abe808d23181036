//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef BFA_METHOD_HPP
#define BFA_METHOD_HPP

/**
 * @file method.hpp
 * @brief Bus factor calculation methods and their registry.
 *
 * A method decides how ownership and the contributor ranking are derived;
 * the removal simulation is shared. Built-in methods:
 * - abf: Avelino et al., ownership from raw blame line counts
 * - jbf: Jabrayilzade et al., ownership from decay-weighted line counts
 */

#include "bfa/config.hpp"
#include "bfa/error.hpp"
#include "bfa/observer.hpp"
#include "bfa/result.hpp"
#include "bfa/types.hpp"
#include "bfa/report/report.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace bfa::methods {

    /**
     * Ownership produced by a method. weighted_authorship is set when the
     * method rescaled line counts before resolving owners.
     */
    struct OwnershipModel {
        FileOwnership ownership;
        std::optional<FileAuthorship> weighted_authorship;
    };

    /**
     * Per-run settings shared by every method.
     */
    struct RunContext {
        AnalysisConfig config;
        Timestamp current_time;
    };

    /**
     * Base interface for calculation methods.
     */
    class IBusFactorMethod {
    public:
        virtual ~IBusFactorMethod() = default;

        /**
         * Short name used for dispatch ("abf", "jbf").
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Full method title shown in reports.
         */
        [[nodiscard]] virtual std::string_view title() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Whether the method consumes per-file commit history.
         */
        [[nodiscard]] virtual bool needs_history() const noexcept { return false; }

        [[nodiscard]] virtual OwnershipModel compute_ownership(
            const AnalysisInput& input,
            const RunContext& context
        ) const = 0;

        [[nodiscard]] virtual ContributorRanking compute_ranking(
            const OwnershipModel& model
        ) const = 0;

        /**
         * Runs the removal simulation. The default is shared by all
         * built-in methods.
         */
        [[nodiscard]] virtual RemovalResult simulate_removal(
            const ContributorRanking& ranking,
            const OwnershipModel& model,
            const RunContext& context
        ) const;

        [[nodiscard]] virtual report::Report build_report(
            const AnalysisInput& input,
            const OwnershipModel& model,
            const RemovalResult& removal,
            const RunContext& context
        ) const = 0;
    };

    /**
     * Registry for calculation methods.
     *
     * instance() comes with the built-in methods registered. Separate
     * registries can be created for tests.
     */
    class MethodRegistry {
    public:
        MethodRegistry() = default;

        static MethodRegistry& instance();

        /**
         * Registers a method. A method with the same name is replaced.
         */
        void register_method(std::unique_ptr<IBusFactorMethod> method);

        [[nodiscard]] const IBusFactorMethod* find(std::string_view name) const;
        [[nodiscard]] std::vector<const IBusFactorMethod*> list() const;

    private:
        std::vector<std::unique_ptr<IBusFactorMethod>> methods_;
    };

    [[nodiscard]] std::unique_ptr<IBusFactorMethod> make_standard_method();
    [[nodiscard]] std::unique_ptr<IBusFactorMethod> make_time_weighted_method();

    /**
     * Registers abf and jbf into a registry.
     */
    void register_builtin_methods(MethodRegistry& registry);

    /**
     * Runs one method end to end: ownership, ranking, removal, report.
     *
     * @return The report, or ConfigError when the configuration is invalid.
     */
    [[nodiscard]] Result<report::Report, Error> run_analysis(
        const IBusFactorMethod& method,
        const AnalysisInput& input,
        const RunContext& context,
        IAnalysisObserver& observer = null_observer()
    );

    /**
     * Dispatches by method name.
     *
     * @return The report, NotFound for an unknown method, or ConfigError.
     */
    [[nodiscard]] Result<report::Report, Error> run_analysis(
        std::string_view method_name,
        const AnalysisInput& input,
        const RunContext& context,
        IAnalysisObserver& observer = null_observer(),
        const MethodRegistry& registry = MethodRegistry::instance()
    );

    [[nodiscard]] report::Report run_standard_analysis(
        const AuthorshipData& data,
        IAnalysisObserver& observer = null_observer()
    );

    [[nodiscard]] Result<report::Report, Error> run_time_weighted_analysis(
        const AuthorshipData& data,
        const FileCommitHistory& history,
        const AnalysisConfig& config,
        Timestamp current_time = std::chrono::system_clock::now(),
        IAnalysisObserver& observer = null_observer()
    );

}  // namespace bfa::methods

#endif //BFA_METHOD_HPP
