//
// Created by gregorian-rayne on 2/14/26.
//

#include "bfa/methods/method.hpp"
#include "bfa/simulation/removal_simulator.hpp"

#include <algorithm>

namespace bfa::methods
{
    RemovalResult IBusFactorMethod::simulate_removal(
        const ContributorRanking& ranking,
        const OwnershipModel& model,
        const RunContext& context
    ) const {
        return simulation::simulate_removal(ranking, model.ownership, context.config.threshold);
    }

    MethodRegistry& MethodRegistry::instance() {
        static MethodRegistry registry = [] {
            MethodRegistry r;
            register_builtin_methods(r);
            return r;
        }();
        return registry;
    }

    void MethodRegistry::register_method(std::unique_ptr<IBusFactorMethod> method) {
        const auto it = std::ranges::find_if(methods_,
            [&method](const std::unique_ptr<IBusFactorMethod>& existing) {
                return existing->name() == method->name();
            });
        if (it != methods_.end()) {
            *it = std::move(method);
            return;
        }
        methods_.push_back(std::move(method));
    }

    const IBusFactorMethod* MethodRegistry::find(const std::string_view name) const {
        for (const auto& method : methods_) {
            if (method->name() == name) {
                return method.get();
            }
        }
        return nullptr;
    }

    std::vector<const IBusFactorMethod*> MethodRegistry::list() const {
        std::vector<const IBusFactorMethod*> result;
        result.reserve(methods_.size());

        for (const auto& method : methods_) {
            result.push_back(method.get());
        }

        return result;
    }

    void register_builtin_methods(MethodRegistry& registry) {
        registry.register_method(make_standard_method());
        registry.register_method(make_time_weighted_method());
    }

    Result<report::Report, Error> run_analysis(
        const IBusFactorMethod& method,
        const AnalysisInput& input,
        const RunContext& context,
        IAnalysisObserver& observer
    ) {
        if (auto valid = context.config.validate(); valid.is_err()) {
            return Result<report::Report, Error>::failure(valid.error());
        }

        observer.on_start(method.name(), input.authorship.total_files);

        const OwnershipModel model = method.compute_ownership(input, context);
        const ContributorRanking ranking = method.compute_ranking(model);
        const RemovalResult removal = method.simulate_removal(ranking, model, context);

        for (const auto& step : removal.steps) {
            observer.on_removal(step, model.ownership.size());
        }
        observer.on_complete(removal);

        return Result<report::Report, Error>::success(
            method.build_report(input, model, removal, context)
        );
    }

    Result<report::Report, Error> run_analysis(
        const std::string_view method_name,
        const AnalysisInput& input,
        const RunContext& context,
        IAnalysisObserver& observer,
        const MethodRegistry& registry
    ) {
        const IBusFactorMethod* method = registry.find(method_name);
        if (!method) {
            return Result<report::Report, Error>::failure(
                Error::not_found("Unknown bus factor calculation method", std::string(method_name))
            );
        }
        return run_analysis(*method, input, context, observer);
    }

    report::Report run_standard_analysis(const AuthorshipData& data, IAnalysisObserver& observer) {
        const auto method = make_standard_method();
        const AnalysisInput input{data, {}};
        const RunContext context{AnalysisConfig{}, std::chrono::system_clock::now()};

        // The default configuration always validates.
        return run_analysis(*method, input, context, observer).value();
    }

    Result<report::Report, Error> run_time_weighted_analysis(
        const AuthorshipData& data,
        const FileCommitHistory& history,
        const AnalysisConfig& config,
        const Timestamp current_time,
        IAnalysisObserver& observer
    ) {
        const auto method = make_time_weighted_method();
        const AnalysisInput input{data, history};
        return run_analysis(*method, input, RunContext{config, current_time}, observer);
    }
}  // namespace bfa::methods
