// =============================================================================
// concepts.hpp — C++20 concepts that formalise every pluggable interface.
//
// Concepts defined:
//   PositionalStore   — raw cell storage behind a genome (contiguous or linked)
//   GenomeModel       — the public surface of a TE genome engine
// =============================================================================
#pragma once

#include "types.hpp"

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tesim {

// ─────────────────────────────────────────────────────────────────────────────
// PositionalStore — the minimal interface every storage backend must satisfy.
// Indices are 0-based; insert_run shifts every cell at or after `at` forward.
// ─────────────────────────────────────────────────────────────────────────────
template <typename S>
concept PositionalStore = requires(S s, const S cs,
                                   Position p, Nucleotide sym) {
    // Construct with n Empty cells.
    { S(p) };

    { cs.size()               } -> std::convertible_to<Position>;
    { cs.at(p)                } -> std::convertible_to<Nucleotide>;
    { cs.to_sequence()        } -> std::same_as<std::vector<Nucleotide>>;

    { s.insert_run(p, sym, p) };
    { s.set_range(p, p, sym)  };
};

// ─────────────────────────────────────────────────────────────────────────────
// GenomeModel — anything callers can drive as a circular TE genome.
// ─────────────────────────────────────────────────────────────────────────────
template <typename G>
concept GenomeModel = requires(G g, const G cg, Position p, TEID te) {
    { g.insert_te(p, p)  } -> std::same_as<TEID>;
    { g.copy_te(te, p)   } -> std::same_as<std::optional<TEID>>;
    { g.disable_te(te)   };

    { cg.active_tes()    } -> std::same_as<std::vector<TEID>>;
    { cg.range_of(te)    } -> std::same_as<std::optional<TERange>>;
    { cg.length()        } -> std::convertible_to<Position>;
    { cg.ids_issued()    } -> std::convertible_to<TEID>;
    { cg.render()        } -> std::same_as<std::string>;
};

}  // namespace tesim
