// =============================================================================
// render.hpp — Linearise a store into a display string.
//
// One character per cell starting at index 0: '-' empty, 'A' active TE,
// 'x' disabled TE.  The genome is circular, so the last character is
// conceptually followed by the first.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "contiguous_store.hpp"
#include "types.hpp"

#include <string>

namespace tesim {

template <PositionalStore Store>
[[nodiscard]] std::string render(const Store& store) {
    std::string out;
    out.reserve(static_cast<std::size_t>(store.size()));
    for (Nucleotide n : store.to_sequence()) out.push_back(to_char(n));
    return out;
}

// Contiguous cells can be read in place without the intermediate copy.
[[nodiscard]] inline std::string render(const ContiguousStore& store) {
    std::string out;
    out.reserve(store.cells().size());
    for (Nucleotide n : store.cells()) out.push_back(to_char(n));
    return out;
}

}  // namespace tesim
