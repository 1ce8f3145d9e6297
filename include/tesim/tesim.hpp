// =============================================================================
// tesim.hpp — Single-include convenience header for the transposon simulator.
//
//   #include "tesim/tesim.hpp"   // everything
//
// Or pick what you need:
//
//   #include "tesim/types.hpp"
//   #include "tesim/genome.hpp"
//   #include "tesim/simulation.hpp"
// =============================================================================
#pragma once

// ── Core types & concepts ───────────────────────────────────────────────────
#include "types.hpp"
#include "concepts.hpp"

// ── Storage backends ────────────────────────────────────────────────────────
#include "contiguous_store.hpp"
#include "linked_store.hpp"

// ── TE registry & genome engine ─────────────────────────────────────────────
#include "te_registry.hpp"
#include "render.hpp"
#include "genome.hpp"

// ── Simulation drivers ──────────────────────────────────────────────────────
#include "events.hpp"
#include "simulation.hpp"

// ── Analysis ────────────────────────────────────────────────────────────────
#include "statistics.hpp"
