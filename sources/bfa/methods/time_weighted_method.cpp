//
// Created by gregorian-rayne on 2/14/26.
//

#include "bfa/methods/method.hpp"
#include "bfa/decay/knowledge_decay.hpp"
#include "bfa/ownership/authorship_aggregator.hpp"
#include "bfa/ownership/ownership_resolver.hpp"

namespace bfa::methods
{
    namespace {

        constexpr report::RiskWording TIME_WEIGHTED_WORDING{
            {"Recent knowledge is concentrated in a single developer.",
             "Urgent action needed. Implement immediate knowledge transfer sessions and pair programming."},
            {"Very few developers hold current project knowledge.",
             "Prioritize knowledge sharing through code reviews, documentation, and rotating responsibilities."},
            {"Knowledge distribution could be improved.",
             "Continue promoting cross-team collaboration and regular knowledge sharing sessions."},
            {"Current knowledge is well distributed.",
             "Maintain current practices and monitor for changes in contribution patterns."}
        };

        /**
         * Time-weighted method (Jabrayilzade et al.).
         *
         * Commit history is trimmed to the configured window, line counts
         * are decayed by the recency of each contributor's last commit to
         * the file, and ownership is resolved on the weighted counts.
         */
        class TimeWeightedMethod final : public IBusFactorMethod {
        public:
            [[nodiscard]] std::string_view name() const noexcept override {
                return "jbf";
            }

            [[nodiscard]] std::string_view title() const noexcept override {
                return "Jabrayilzade et al. - JBF (Time-Weighted Bus Factor)";
            }

            [[nodiscard]] std::string_view description() const noexcept override {
                return "Advanced method using knowledge decay and time-weighted contributions";
            }

            [[nodiscard]] bool needs_history() const noexcept override {
                return true;
            }

            [[nodiscard]] OwnershipModel compute_ownership(
                const AnalysisInput& input,
                const RunContext& context
            ) const override {
                const auto& config = context.config;
                const FileCommitHistory window =
                    decay::trim_to_window(input.history, config.window_days, context.current_time);

                FileAuthorship weighted = decay::apply_decay(
                    input.authorship.file_authorship,
                    window,
                    config.decay_rate,
                    context.current_time,
                    config.max_decay_multiplier
                );

                OwnershipModel model;
                model.ownership = ownership::resolve_ownership(weighted);
                model.weighted_authorship = std::move(weighted);
                return model;
            }

            [[nodiscard]] ContributorRanking compute_ranking(const OwnershipModel& model) const override {
                if (!model.weighted_authorship) {
                    return ownership::compute_doa(model.ownership);
                }
                return ownership::compute_weighted_doa(model.ownership, *model.weighted_authorship);
            }

            [[nodiscard]] report::Report build_report(
                const AnalysisInput& input,
                const OwnershipModel& model,
                const RemovalResult& removal,
                const RunContext& context
            ) const override {
                report::ReportOptions options;
                options.method = std::string(title());
                options.description = std::string(description());
                options.threshold = context.config.threshold;
                options.top_contributors = context.config.top_contributors;
                options.metadata = report::DecayMetadata{
                    context.config.decay_rate,
                    context.config.window_days,
                    context.current_time
                };
                options.wording = &TIME_WEIGHTED_WORDING;
                options.weighted_authorship = model.weighted_authorship ? &*model.weighted_authorship : nullptr;

                return report::build_report(input.authorship, model.ownership, removal, options);
            }
        };

    }  // namespace

    std::unique_ptr<IBusFactorMethod> make_time_weighted_method() {
        return std::make_unique<TimeWeightedMethod>();
    }
}  // namespace bfa::methods
