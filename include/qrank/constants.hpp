#pragma once

#include <cstddef>

/// @file include/qrank/constants.hpp
/// @brief Numerical and ranking constants for the QRank engine.
///
/// Defaults for configurable values live here so that the built-in
/// configuration, the YAML loader and the tests agree on one number.

namespace qrank::constants {

// ─── Normalization ────────────────────────────────────────────────────────────

/// Normalized value assigned to missing, invalid or degenerate factors.
static constexpr double NEUTRAL_SCORE = 50.0;

/// Upper bound of the normalized scale (lower bound is 0).
static constexpr double NORMALIZED_MAX = 100.0;

/// z-scores are clipped to [-Z_CLIP, Z_CLIP] before rescaling.
static constexpr double Z_CLIP = 3.0;

/// Relative flatness threshold: σ ≤ FLAT_STDDEV_THRESHOLD · max(1, |μ|)
/// is treated as zero variance.
static constexpr double FLAT_STDDEV_THRESHOLD = 1e-9;

// ─── Fusion ───────────────────────────────────────────────────────────────────

/// total_score is mapped to [0, 1] via (total + OFFSET) / (2 · OFFSET).
///
/// Factor weights multiply 0-100 normalized values, so a weight table keeps
/// total_score in [-OFFSET, OFFSET] only while Σ|w| · 100 ≤ 2 · OFFSET.
/// Larger tables saturate factor_norm at 1 and fusion loses the factor term.
/// The built-in table has Σ|w| · 100 = 2.16.
static constexpr double FACTOR_SCORE_HALF_RANGE = 2.0;

/// Probability that carries no directional information.
static constexpr double ML_NEUTRAL_PROBABILITY = 0.5;

/// Confidence at or above this (and below confidence_threshold) is "medium".
static constexpr double MEDIUM_CONFIDENCE_FLOOR = 0.5;

/// Risk at or below this (and above risk_threshold) is "medium".
static constexpr double MEDIUM_RISK_CEILING = 0.6;

/// Applied consensus bonus above this is labelled "high consensus".
static constexpr double HIGH_CONSENSUS_BONUS = 0.1;

static constexpr double DEFAULT_ML_WEIGHT            = 0.4;
static constexpr double DEFAULT_FACTOR_WEIGHT        = 0.6;
static constexpr double DEFAULT_ML_THRESHOLD         = 0.6;
static constexpr double DEFAULT_FACTOR_THRESHOLD     = 0.5;
static constexpr double DEFAULT_CONFIDENCE_THRESHOLD = 0.7;
static constexpr double DEFAULT_RISK_THRESHOLD       = 0.3;
static constexpr double DEFAULT_CONSENSUS_BONUS      = 0.15;
static constexpr double DEFAULT_BASE_WEIGHT          = 0.5;
static constexpr double DEFAULT_FACTOR_BOOST         = 0.5;

// ─── Ranking ──────────────────────────────────────────────────────────────────

/// Number of recommendations kept after sorting.
static constexpr std::size_t DEFAULT_TOP_N = 10;

/// |day change %| must be strictly below this for a stock to be listed.
static constexpr double DEFAULT_MAX_ABS_CHANGE_PCT = 10.0;

}  // namespace qrank::constants
