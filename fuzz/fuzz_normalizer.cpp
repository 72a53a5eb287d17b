/**
 * @file  fuzz_normalizer.cpp
 * @brief libFuzzer target for FactorNormalizer.
 *
 * Build:
 *   cmake -DQRANK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_normalizer
 *
 * Input layout (repeated 10-byte records):
 *   [0]     stock id selector (duplicates allowed)
 *   [1]     factor key selector, bit 7 set ⇒ value missing
 *   [2..9]  raw value (double bits, may be NaN / inf / subnormal)
 *
 * Safety invariants verified on every input:
 *   1. Every normalized value lies in [0, 100].
 *   2. Every stock carries every factor key of the Universe.
 *   3. A key whose statistics are flat maps every stock to exactly 50.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "qrank/log.hpp"
#include "qrank/normalizer.hpp"

using namespace qrank;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = (qrank::log::set_level("off"), true);
    (void)quiet;

    constexpr std::size_t kRecord = 10;

    Universe universe;
    for (std::size_t off = 0; off + kRecord <= size; off += kRecord) {
        const uint8_t* rec = data + off;
        const std::string id  = "S" + std::to_string(rec[0] % 32);
        const std::string key = "k" + std::to_string(rec[1] & 0x07u);

        FactorValue value;
        if ((rec[1] & 0x80u) == 0) {
            double v;
            std::memcpy(&v, rec + 2, sizeof(double));
            value = v;
        }
        universe.push_back(StockFactors{.stock_id = id, .factors = {{key, value}}});
    }

    const auto out = FactorNormalizer{}.normalize(universe);

    for (const auto& [id, factors] : out.by_stock) {
        // Invariant 2
        assert(factors.size() == out.stats.size());
        for (const auto& [key, n] : factors) {
            // Invariant 1
            assert(n >= 0.0 && n <= 100.0);
            // Invariant 3
            if (out.stats.at(key).flat) {
                assert(n == 50.0);
            }
        }
    }
    return 0;
}
