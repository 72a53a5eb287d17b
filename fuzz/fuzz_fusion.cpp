/**
 * @file  fuzz_fusion.cpp
 * @brief libFuzzer target for FusionEngine and RecommendationRanker.
 *
 * Build:
 *   cmake -DQRANK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_fusion
 *
 * Run for 60 seconds:
 *   ./fuzz_fusion -max_total_time=60
 *
 * Input layout (repeated 25-byte records):
 *   [0]      fusion method selector
 *   [1..8]   total_score     (raw double bits, may be NaN / inf)
 *   [9..16]  ml_probability  (raw double bits; absent if byte 0 bit 7 set)
 *   [17..24] change_pct      (raw double bits)
 *
 * Safety invariants verified on every input:
 *   1. fuse() never throws on any input, never crashes.
 *   2. A Fused result never has a NaN final_score.
 *   3. filter_first never fuses a stock with ml < ml_threshold.
 *   4. Ranked output has ranks 1..n and every kept change_pct is within bounds.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "qrank/fusion.hpp"
#include "qrank/log.hpp"
#include "qrank/ranking.hpp"

using namespace qrank;

static double read_double(const uint8_t* p) {
    double v;
    std::memcpy(&v, p, sizeof(double));
    return v;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = (qrank::log::set_level("off"), true);
    (void)quiet;

    constexpr std::size_t kRecord = 25;
    if (size < kRecord) {
        return 0;
    }

    const auto methods = all_fusion_methods();
    const FusionMethod method = methods[data[0] % methods.size()];
    const FusionEngine engine(FusionConfig{.method = method});

    std::vector<RankCandidate> candidates;
    for (std::size_t off = 0, i = 0; off + kRecord <= size; off += kRecord, ++i) {
        const uint8_t* rec = data + off;

        FusionInput in;
        in.stock_id    = "S" + std::to_string(i % 16);
        in.total_score = read_double(rec + 1);
        if ((rec[0] & 0x80u) == 0) {
            in.ml_probability = read_double(rec + 9);
        }

        const auto outcome = engine.fuse(in);
        if (outcome.disposition != FusionDisposition::Fused) {
            assert(!outcome.result.has_value());
            continue;
        }
        assert(outcome.result.has_value());

        const auto& r = *outcome.result;
        // Invariant 2: finite inputs may overflow to ±inf but never NaN
        assert(!std::isnan(r.final_score));

        // Invariant 3: filter_first exclusivity
        if (method == FusionMethod::FilterFirst) {
            assert(r.ml_probability.has_value());
            assert(*r.ml_probability >= engine.config().params.ml_threshold);
        }

        RankCandidate c;
        c.fusion = r;
        c.meta   = StockMeta{.name = in.stock_id, .last_price = 1.0,
                             .change_pct = read_double(rec + 17)};
        candidates.push_back(std::move(c));
    }

    const RecommendationRanker ranker;
    const auto ranked = ranker.rank(candidates, Timestamp{});

    // Invariant 4: contiguous ranks, change bound respected
    for (std::size_t i = 0; i < ranked.recommendations.size(); ++i) {
        const auto& rec = ranked.recommendations[i];
        assert(rec.rank == i + 1);
        assert(std::abs(rec.meta.change_pct) < ranker.config().rules.max_abs_change_pct);
    }
    return 0;
}
