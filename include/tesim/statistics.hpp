// =============================================================================
// statistics.hpp — Genome summary statistics and invariant checks.
//
// Works on any genome that satisfies GenomeModel, so the same report can be
// produced for the contiguous and the linked backend and compared directly.
//
// Provided:
//   - GenomeSummary: cell counts per state, active TE count, ids issued
//   - check_invariants: list of violated registry/storage invariants
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "types.hpp"

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace tesim {

// ── GenomeSummary ───────────────────────────────────────────────────────────
struct GenomeSummary {
    Position    length         = 0;
    Position    empty_cells    = 0;
    Position    active_cells   = 0;
    Position    disabled_cells = 0;
    std::size_t active_tes     = 0;
    TEID        ids_issued     = 0;

    friend bool operator==(const GenomeSummary&, const GenomeSummary&) = default;
};

template <GenomeModel G>
[[nodiscard]] GenomeSummary summarize(const G& genome) {
    GenomeSummary ss;
    ss.length     = genome.length();
    ss.active_tes = genome.active_tes().size();
    ss.ids_issued = genome.ids_issued();
    for (char c : genome.render()) {
        switch (c) {
            case 'A': ++ss.active_cells;   break;
            case 'x': ++ss.disabled_cells; break;
            default:  ++ss.empty_cells;    break;
        }
    }
    return ss;
}

inline std::ostream& operator<<(std::ostream& os, const GenomeSummary& ss) {
    return os << "length=" << ss.length
              << " empty=" << ss.empty_cells
              << " active=" << ss.active_cells
              << " disabled=" << ss.disabled_cells
              << " tes=" << ss.active_tes
              << " issued=" << ss.ids_issued;
}

// ── Invariant check ─────────────────────────────────────────────────────────
// Returns one message per violation; an empty vector means the genome is
// consistent:
//   - render() has exactly length() characters
//   - every registered range is non-empty and inside [0, length())
//   - registered ranges are pairwise disjoint
//   - the 'A' cells of render() are exactly the union of registered ranges
template <GenomeModel G>
[[nodiscard]] std::vector<std::string> check_invariants(const G& genome) {
    std::vector<std::string> problems;
    const std::string s = genome.render();
    const Position n = genome.length();

    if (static_cast<Position>(s.size()) != n) {
        problems.push_back("render() has " + std::to_string(s.size())
                           + " cells but length() is " + std::to_string(n));
        return problems;
    }

    std::vector<bool> covered(s.size(), false);
    std::vector<TERange> seen;
    for (TEID id : genome.active_tes()) {
        const auto r = genome.range_of(id);
        if (!r) {
            problems.push_back("TE " + std::to_string(id) + " listed active without a range");
            continue;
        }
        if (r->start >= r->end || r->start < 0 || r->end > n) {
            problems.push_back("TE " + std::to_string(id) + " has invalid range ["
                               + std::to_string(r->start) + ", "
                               + std::to_string(r->end) + ")");
            continue;
        }
        const bool clash = std::any_of(seen.begin(), seen.end(),
                                       [&](const TERange& o) { return o.overlaps(*r); });
        if (clash)
            problems.push_back("TE " + std::to_string(id) + " overlaps another active TE");
        seen.push_back(*r);
        for (Position i = r->start; i < r->end; ++i)
            covered[static_cast<std::size_t>(i)] = true;
    }

    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((s[i] == 'A') != covered[i]) {
            problems.push_back("cell " + std::to_string(i) + " renders '"
                               + std::string(1, s[i]) + "' but is "
                               + (covered[i] ? "" : "not ") + "covered by an active TE");
        }
    }
    return problems;
}

}  // namespace tesim
