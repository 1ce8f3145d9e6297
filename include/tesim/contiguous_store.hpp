// =============================================================================
// contiguous_store.hpp — Contiguous-memory cell storage backend.
//
// Layout: a flat std::vector<Nucleotide>, one entry per genome cell in index
// order.  Random access is O(1); inserting a run in the middle shifts every
// later cell, so it costs O(n) per insertion (amortised O(1) at the end).
// =============================================================================
#pragma once

#include "types.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace tesim {

class ContiguousStore {
public:
    // ── Construction ────────────────────────────────────────────────────────
    ContiguousStore() = default;

    explicit ContiguousStore(Position n) {
        if (n < 0) throw std::invalid_argument("Genome size must be non-negative");
        cells_.assign(static_cast<std::size_t>(n), Nucleotide::Empty);
    }

    // ── PositionalStore concept interface ───────────────────────────────────

    [[nodiscard]] Position size() const noexcept {
        return static_cast<Position>(cells_.size());
    }

    [[nodiscard]] Nucleotide at(Position i) const {
        if (i < 0 || i >= size())
            throw std::out_of_range("Cell index " + std::to_string(i) + " out of range");
        return cells_[static_cast<std::size_t>(i)];
    }

    /// Insert `count` copies of `symbol` so that the first lands at index `at`.
    /// `at == size()` appends.
    void insert_run(Position at, Nucleotide symbol, Position count) {
        if (at < 0 || at > size())
            throw std::out_of_range("Insertion point " + std::to_string(at) + " out of range");
        if (count <= 0) return;
        cells_.insert(cells_.begin() + at, static_cast<std::size_t>(count), symbol);
    }

    /// Overwrite cells [start, end) with `symbol`.
    void set_range(Position start, Position end, Nucleotide symbol) {
        if (start < 0 || end > size() || start > end)
            throw std::out_of_range("Range [" + std::to_string(start) + ", "
                                    + std::to_string(end) + ") out of range");
        std::fill(cells_.begin() + start, cells_.begin() + end, symbol);
    }

    [[nodiscard]] std::vector<Nucleotide> to_sequence() const { return cells_; }

    // ── Direct access (renderer fast path) ──────────────────────────────────

    [[nodiscard]] const std::vector<Nucleotide>& cells() const noexcept { return cells_; }

private:
    std::vector<Nucleotide> cells_;
};

}  // namespace tesim
