// =============================================================================
// simulation.hpp — Seeded random-operation driver for TE genomes.
//
// TransposonSimulation<GenomeType> owns the RNG and the step counter and, on
// every step, applies one of
//   1. insert  – a fresh TE of random length at a random position,
//   2. copy    – a random active TE copied by a random (signed) offset,
//   3. disable – a random active TE disabled,
// chosen with the weights in SimulationConfig.  Every applied operation is
// appended to a log that replay() can apply to another genome, which is how
// the two storage backends are checked against each other.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "events.hpp"
#include "types.hpp"

#include <cstdint>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tesim {

// ── Configuration ───────────────────────────────────────────────────────────
struct SimulationConfig {
    std::size_t initial_tes     = 5;     // inserts applied by seed_genome()
    double      insert_weight   = 0.4;
    double      copy_weight     = 0.4;
    double      disable_weight  = 0.2;
    Position    max_te_length   = 10;    // lengths drawn from [1, max_te_length]
    Position    max_copy_offset = 50;    // offsets drawn from [-max, +max]

    void validate() const {
        if (insert_weight < 0 || copy_weight < 0 || disable_weight < 0)
            throw std::invalid_argument("Operation weights must be non-negative");
        if (insert_weight + copy_weight + disable_weight <= 0)
            throw std::invalid_argument("At least one operation weight must be positive");
        if (max_te_length < 1)
            throw std::invalid_argument("max_te_length must be at least 1");
        if (max_copy_offset < 0)
            throw std::invalid_argument("max_copy_offset must be non-negative");
    }
};

// ── TransposonSimulation ────────────────────────────────────────────────────
template <GenomeModel GenomeType>
class TransposonSimulation {
public:
    TransposonSimulation(GenomeType& genome, std::uint64_t seed,
                         SimulationConfig config = {})
        : genome_{genome}, rng_{seed}, config_{config}
    {
        config_.validate();
    }

    /// Attach an event handler bundle.
    TransposonSimulation& set_events(SimulationEvents<GenomeType> ev) {
        events_ = std::move(ev);
        return *this;
    }

    /// Insert `config.initial_tes` random TEs.  Not counted as steps.
    void seed_genome() {
        for (std::size_t i = 0; i < config_.initial_tes; ++i) apply_insert();
    }

    /// Run for `num_steps` steps, stopping early if should_stop says so.
    void run(Step num_steps) {
        for (Step s = 0; s < num_steps; ++s) {
            step();
            if (events_.should_stop && events_.should_stop(step_ - 1, genome_))
                break;
        }
    }

    /// Execute a single step.
    void step() {
        std::discrete_distribution<int> op_dist{
            config_.insert_weight, config_.copy_weight, config_.disable_weight};

        switch (op_dist(rng_)) {
            case 0:  apply_insert();  break;
            case 1:  apply_copy();    break;
            default: apply_disable(); break;
        }

        if (events_.on_step_end) events_.on_step_end(step_, genome_);
        ++step_;
    }

    // ── Accessors ───────────────────────────────────────────────────────────
    [[nodiscard]] Step steps_taken() const noexcept { return step_; }
    [[nodiscard]] const std::vector<OperationRecord>& log() const noexcept { return log_; }
    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::mt19937_64& rng() noexcept { return rng_; }

private:
    void apply_insert() {
        std::uniform_int_distribution<Position> pos_dist(0, genome_.length());
        std::uniform_int_distribution<Position> len_dist(1, config_.max_te_length);
        const Position pos = pos_dist(rng_);
        const Position len = len_dist(rng_);

        const TEID id = genome_.insert_te(pos, len);
        log_.push_back(OperationRecord{step_, OpKind::Insert, pos, len, kNoTE, id});
        if (events_.on_insert) events_.on_insert(step_, id, genome_);
    }

    void apply_copy() {
        const auto active = genome_.active_tes();
        if (active.empty()) return;

        const TEID src = pick(active);
        std::uniform_int_distribution<Position> off_dist(-config_.max_copy_offset,
                                                         config_.max_copy_offset);
        const Position offset = off_dist(rng_);

        const auto id = genome_.copy_te(src, offset);
        log_.push_back(OperationRecord{step_, OpKind::Copy, 0, offset, src,
                                       id.value_or(kNoTE)});
        if (events_.on_copy) events_.on_copy(step_, src, id, genome_);
    }

    void apply_disable() {
        const auto active = genome_.active_tes();
        if (active.empty()) return;

        const TEID victim = pick(active);
        genome_.disable_te(victim);
        log_.push_back(OperationRecord{step_, OpKind::Disable, 0, 0, victim, kNoTE});
        if (events_.on_disable) events_.on_disable(step_, victim, genome_);
    }

    [[nodiscard]] TEID pick(const std::vector<TEID>& ids) {
        std::uniform_int_distribution<std::size_t> d(0, ids.size() - 1);
        return ids[d(rng_)];
    }

    GenomeType&                  genome_;
    std::mt19937_64              rng_;
    SimulationConfig             config_;
    Step                         step_ = 0;
    SimulationEvents<GenomeType> events_;
    std::vector<OperationRecord> log_;
};

// ── Replay ──────────────────────────────────────────────────────────────────
/// Apply a recorded operation log to `genome`.  Returns the ids produced, one
/// per record (kNoTE for disables and failed copies).
template <GenomeModel GenomeType>
std::vector<TEID> replay(GenomeType& genome, const std::vector<OperationRecord>& log) {
    std::vector<TEID> produced;
    produced.reserve(log.size());
    for (const auto& op : log) {
        switch (op.kind) {
            case OpKind::Insert:
                produced.push_back(genome.insert_te(op.pos, op.arg));
                break;
            case OpKind::Copy:
                produced.push_back(genome.copy_te(op.source, op.arg).value_or(kNoTE));
                break;
            case OpKind::Disable:
                genome.disable_te(op.source);
                produced.push_back(kNoTE);
                break;
        }
    }
    return produced;
}

}  // namespace tesim
