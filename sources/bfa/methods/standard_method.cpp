//
// Created by gregorian-rayne on 2/14/26.
//

#include "bfa/methods/method.hpp"
#include "bfa/ownership/authorship_aggregator.hpp"
#include "bfa/ownership/ownership_resolver.hpp"

namespace bfa::methods
{
    namespace {

        class StandardMethod final : public IBusFactorMethod {
        public:
            [[nodiscard]] std::string_view name() const noexcept override {
                return "abf";
            }

            [[nodiscard]] std::string_view title() const noexcept override {
                return "Avelino et al. - ABF (Authorship-Based Factor)";
            }

            [[nodiscard]] std::string_view description() const noexcept override {
                return "Iteratively removes developers with highest Degree of Authorship "
                       "until the share of files without an owner exceeds the threshold";
            }

            [[nodiscard]] OwnershipModel compute_ownership(
                const AnalysisInput& input,
                const RunContext& /*context*/
            ) const override {
                return {ownership::resolve_ownership(input.authorship.file_authorship), std::nullopt};
            }

            [[nodiscard]] ContributorRanking compute_ranking(const OwnershipModel& model) const override {
                return ownership::compute_doa(model.ownership);
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
                options.wording = &report::default_risk_wording();

                return report::build_report(input.authorship, model.ownership, removal, options);
            }
        };

    }  // namespace

    std::unique_ptr<IBusFactorMethod> make_standard_method() {
        return std::make_unique<StandardMethod>();
    }
}  // namespace bfa::methods
