// =============================================================================
// breedcalc.hpp — Single-include convenience header for the breeding
// evaluator.
//
//   #include "breedcalc/breedcalc.hpp"   // everything
//
// Or pick what you need:
//
//   #include "breedcalc/types.hpp"
//   #include "breedcalc/pairing_score.hpp"
//   #include "breedcalc/pair_search.hpp"
//   ...
// =============================================================================
#pragma once

// ── Core types & concepts ───────────────────────────────────────────────────
#include "types.hpp"
#include "concepts.hpp"
#include "validation.hpp"

// ── Genotype space & ordering ───────────────────────────────────────────────
#include "genotype_space.hpp"
#include "ranking.hpp"
#include "order_statistics.hpp"

// ── Scores ──────────────────────────────────────────────────────────────────
#include "pairing_score.hpp"
#include "quality_score.hpp"
#include "candidate_metrics.hpp"

// ── Search & state ──────────────────────────────────────────────────────────
#include "pair_search.hpp"
#include "roster.hpp"
