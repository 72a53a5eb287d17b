/**
 * @file  fuzz_config.cpp
 * @brief libFuzzer target for ConfigLoader::parse_string.
 *
 * Build:
 *   cmake -DQRANK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_config
 *
 * Safety invariants verified on every input:
 *   1. Arbitrary bytes either parse into a configuration or raise
 *      ConfigError. No other exception type escapes, no crash.
 *   2. A returned configuration passes validate() again.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "qrank/config.hpp"
#include "qrank/log.hpp"

using namespace qrank;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = (qrank::log::set_level("off"), true);
    (void)quiet;

    const std::string text(reinterpret_cast<const char*>(data), size);
    try {
        const auto cfg = ConfigLoader::parse_string(text);
        cfg.validate();
        assert(cfg.ranker.top_n > 0);
    } catch (const ConfigError&) {
        // Rejected configuration is the expected outcome for most inputs.
    }
    return 0;
}
