/**
 * @file  prop_score_additivity.cpp
 * @brief Property: total_score = Σ sub_score + residual_score (within 1e-9).
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_score_additivity
 *
 * For any weight table and any NormalizedFactorSet on the [0, 100] scale,
 * summing the per-factor contributions recorded in the ScoreBreakdown must
 * reproduce the scorer's own total_score.
 */

#include <rapidcheck.h>
#include <cmath>
#include <string>
#include <vector>

#include "qrank/scoring.hpp"

using namespace qrank;

int main() {
    rc::check(
        "score_additivity: breakdown reconstructs total_score",
        []() {
            const auto n_factors = *rc::gen::inRange<std::size_t>(1, 24);
            const auto n_cats    = *rc::gen::inRange<std::size_t>(0, 6);

            CategoryWeightTable t;
            NormalizedFactorSet normalized;
            for (std::size_t i = 0; i < n_factors; ++i) {
                const std::string f = "f" + std::to_string(i);
                t.factor_weights[f] = *rc::gen::inRange(-1000, 1000) / 1000.0;
                normalized[f]       = *rc::gen::inRange(0, 10000) / 100.0;
            }
            for (std::size_t c = 0; c < n_cats; ++c) {
                t.categories.push_back({"c" + std::to_string(c), {}});
            }
            // Assign each factor to one category or leave it residual.
            for (std::size_t i = 0; i < n_factors; ++i) {
                const auto slot = *rc::gen::inRange<std::size_t>(0, n_cats + 1);
                if (slot < n_cats) {
                    t.categories[slot].factors.push_back("f" + std::to_string(i));
                }
            }

            WeightedScorer scorer(t, {});
            const auto s = scorer.score("X", normalized, {});

            double reconstructed = 0.0;
            for (const auto& c : s.breakdown.categories) {
                for (const auto& fc : c.contributions) {
                    reconstructed += fc.contribution;
                }
            }
            for (const auto& fc : s.breakdown.residual) {
                reconstructed += fc.contribution;
            }

            RC_ASSERT(std::abs(reconstructed - s.total_score) < 1e-9);
        }
    );

    return 0;
}
