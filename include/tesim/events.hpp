// =============================================================================
// events.hpp — Hook system for the transposon simulation loop.
//
// Allows callers to observe every operation the driver applies without
// modifying the TransposonSimulation class.  Useful for:
//   - Logging / progress output
//   - Collecting time-series data
//   - Checking invariants after every step
//
// Usage:
//   SimulationEvents<ListGenome> events;
//   events.on_insert   = [](Step s, TEID id, const ListGenome& g) { ... };
//   events.on_step_end = [](Step s, const ListGenome& g) { ... };
//
//   TransposonSimulation<ListGenome> sim(genome, seed, config);
//   sim.set_events(events).run(100);
//
// Null callbacks are skipped.
// =============================================================================
#pragma once

#include "types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace tesim {

// ── Operation log ───────────────────────────────────────────────────────────
enum class OpKind : std::uint8_t {
    Insert,
    Copy,
    Disable
};

/// One operation applied by the driver.  `arg` is the insertion length for
/// Insert and the offset for Copy; `source` is the TE copied or disabled;
/// `result` is the id produced (kNoTE if none).
struct OperationRecord {
    Step     step   = 0;
    OpKind   kind   = OpKind::Insert;
    Position pos    = 0;
    Position arg    = 0;
    TEID     source = kNoTE;
    TEID     result = kNoTE;
};

// ── SimulationEvents ────────────────────────────────────────────────────────
// A bundle of optional callbacks, one per kind of operation.
//
// All callbacks receive the current step index (0-based) and a read-only
// reference to the genome after the operation has been applied.
// ─────────────────────────────────────────────────────────────────────────────
template <typename GenomeType>
struct SimulationEvents {
    /// Fired after a fresh TE has been inserted.
    std::function<void(Step, TEID, const GenomeType&)> on_insert;

    /// Fired after a copy attempt; the optional is empty if the source was
    /// not active.
    std::function<void(Step, TEID, std::optional<TEID>, const GenomeType&)> on_copy;

    /// Fired after a TE has been disabled.
    std::function<void(Step, TEID, const GenomeType&)> on_disable;

    /// Fired at the end of every step, including steps that changed nothing.
    std::function<void(Step, const GenomeType&)> on_step_end;

    /// Return true to abort the run.  Checked at the end of each step.
    std::function<bool(Step, const GenomeType&)> should_stop;

    [[nodiscard]] bool empty() const noexcept {
        return !on_insert && !on_copy && !on_disable
            && !on_step_end && !should_stop;
    }
};

// ── DataRecorder ────────────────────────────────────────────────────────────
// A pre-built listener that accumulates per-step measurements.
//
// Usage:
//   DataRecorder<ListGenome> rec;
//   rec.sample_interval = 5;
//   events.on_step_end = rec.as_callback();
// ─────────────────────────────────────────────────────────────────────────────
template <typename GenomeType>
struct DataRecorder {
    /// Record every `sample_interval` steps (1 = every step).
    Step sample_interval = 1;

    std::vector<Step>        steps;
    std::vector<Position>    lengths;
    std::vector<std::size_t> active_counts;

    [[nodiscard]] std::function<void(Step, const GenomeType&)> as_callback() {
        return [this](Step s, const GenomeType& g) {
            if (sample_interval > 0 && ((s + 1) % sample_interval != 0))
                return;
            steps.push_back(s);
            lengths.push_back(g.length());
            active_counts.push_back(g.active_tes().size());
        };
    }

    void clear() {
        steps.clear();
        lengths.clear();
        active_counts.clear();
    }
};

}  // namespace tesim
