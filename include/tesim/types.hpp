// =============================================================================
// types.hpp — Core type aliases and constants for the transposon simulator.
//
// Centralises every fundamental type so that width changes (e.g. moving to
// 32-bit positions) propagate automatically.
// =============================================================================
#pragma once

#include <cstdint>
#include <limits>

namespace tesim {

// ── Position / length / offset ──────────────────────────────────────────────
// Signed so that copy offsets (which may point "downwards") and the
// intermediate target positions they produce can be represented directly.
using Position = std::int64_t;

// ── TE identifier ───────────────────────────────────────────────────────────
// Ids are issued by TERegistry::next_id() starting at 1 and never reused.
using TEID = std::uint64_t;

/// Sentinel id; never issued by a registry.
inline constexpr TEID kNoTE = 0;

// ── Simulation step counter ─────────────────────────────────────────────────
using Step = std::uint64_t;

// ── Cell state ──────────────────────────────────────────────────────────────
enum class Nucleotide : std::uint8_t {
    Empty      = 0,
    ActiveTE   = 1,
    DisabledTE = 2
};

/// Display character used by the renderer.
[[nodiscard]] constexpr char to_char(Nucleotide n) noexcept {
    switch (n) {
        case Nucleotide::ActiveTE:   return 'A';
        case Nucleotide::DisabledTE: return 'x';
        case Nucleotide::Empty:      break;
    }
    return '-';
}

// ── Half-open position range [start, end) ───────────────────────────────────
struct TERange {
    Position start = 0;
    Position end   = 0;

    [[nodiscard]] constexpr Position length() const noexcept { return end - start; }

    /// True if `pos` lies in [start, end).
    [[nodiscard]] constexpr bool contains(Position pos) const noexcept {
        return start <= pos && pos < end;
    }

    [[nodiscard]] constexpr bool overlaps(const TERange& o) const noexcept {
        return start < o.end && o.start < end;
    }

    friend constexpr bool operator==(const TERange&, const TERange&) = default;
};

}  // namespace tesim
