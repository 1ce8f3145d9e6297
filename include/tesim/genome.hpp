// =============================================================================
// genome.hpp — Circular TE genome, templated on its storage backend.
//
// Template parameters:
//   Store – ContiguousStore or LinkedStore (or any type that satisfies the
//           PositionalStore concept).
//
// The Genome owns:
//   • the cell storage,
//   • the TERegistry of active TEs and their current ranges,
//   • the id counter (inside the registry).
//
// All insert/copy/disable logic lives here and is shared by both backends;
// the store only knows how to splice runs of cells and overwrite ranges.
// Callers get read-only access to the cells; mutation goes through the
// operations below.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "contiguous_store.hpp"
#include "linked_store.hpp"
#include "render.hpp"
#include "te_registry.hpp"
#include "types.hpp"

#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tesim {

/// Floored modulo: result always lies in [0, m) for m > 0.
[[nodiscard]] constexpr Position wrap_position(Position p, Position m) noexcept {
    const Position r = p % m;
    return r < 0 ? r + m : r;
}

template <PositionalStore Store>
class Genome {
public:
    using store_type = Store;

    // ── Construction ────────────────────────────────────────────────────────
    /// A genome of `n` empty cells with no TEs.
    explicit Genome(Position n) : store_(n) {}

    // ── Core operations ─────────────────────────────────────────────────────

    /// Insert a new active TE of `len` cells so that it starts at `pos`.
    ///
    /// `pos == length()` is accepted and wraps to 0.  Any active TE whose
    /// range contains the (wrapped) insertion point is disabled in full;
    /// TEs starting after it are shifted forward by `len`.
    ///
    /// Throws std::out_of_range if pos < 0 or pos > length(),
    /// std::invalid_argument if len < 1, and std::length_error if the genome
    /// would outgrow Position.  Nothing is modified on throw, including a
    /// throw from the store while splicing.
    TEID insert_te(Position pos, Position len) {
        const Position n = length();
        if (pos < 0 || pos > n)
            throw std::out_of_range("Position " + std::to_string(pos)
                                    + " is out of range of genome of length "
                                    + std::to_string(n));
        if (len < 1)
            throw std::invalid_argument("TE length must be positive, got "
                                        + std::to_string(len));
        if (len > std::numeric_limits<Position>::max() - n)
            throw std::length_error("TE length " + std::to_string(len)
                                    + " overflows genome of length "
                                    + std::to_string(n));

        if (n > 0) pos %= n;

        // At most one active TE can contain pos since ranges are disjoint.
        std::optional<TERange> hit;
        for (const auto& [id, r] : registry_.entries()) {
            if (r.contains(pos)) { hit = r; break; }
        }

        // Splice first so a store that cannot grow leaves the registry as it was.
        store_.insert_run(pos, Nucleotide::ActiveTE, len);

        if (hit) {
            // The colliding TE straddles the new run: [start, pos) stays put,
            // [pos, end) moved up by len.
            store_.set_range(hit->start, pos, Nucleotide::DisabledTE);
            store_.set_range(pos + len, hit->end + len, Nucleotide::DisabledTE);
        }

        registry_.for_each_mut([&](TEID, TERange& r) {
            if (r.contains(pos)) return RegistryAction::Erase;
            if (r.start > pos) {
                r.start += len;
                r.end   += len;
            }
            return RegistryAction::Keep;
        });

        const TEID id = registry_.next_id();
        registry_.insert(id, TERange{pos, pos + len});
        return id;
    }

    /// Copy active TE `te` to `offset` cells from its current start,
    /// wrapping around the ring in either direction.  Returns the new id, or
    /// nothing (and changes nothing) if `te` is not active.
    std::optional<TEID> copy_te(TEID te, Position offset) {
        const auto range = registry_.get(te);
        if (!range) return std::nullopt;
        const Position target = wrap_position(range->start + offset, length());
        return insert_te(target, range->length());
    }

    /// Disable `te` if it is active; unknown or already-disabled ids are
    /// ignored.
    void disable_te(TEID te) {
        if (auto range = registry_.remove(te))
            store_.set_range(range->start, range->end, Nucleotide::DisabledTE);
    }

    // ── Queries ─────────────────────────────────────────────────────────────

    /// Active TE ids in ascending order.
    [[nodiscard]] std::vector<TEID> active_tes() const { return registry_.ids(); }

    [[nodiscard]] std::optional<TERange> range_of(TEID te) const { return registry_.get(te); }
    [[nodiscard]] bool is_active(TEID te) const { return registry_.contains(te); }
    [[nodiscard]] std::size_t num_active() const noexcept { return registry_.size(); }
    [[nodiscard]] TEID ids_issued() const noexcept { return registry_.ids_issued(); }

    [[nodiscard]] Position length() const noexcept { return store_.size(); }

    [[nodiscard]] std::string render() const { return tesim::render(store_); }

    [[nodiscard]] const Store&      store()    const noexcept { return store_; }
    [[nodiscard]] const TERegistry& registry() const noexcept { return registry_; }

private:
    Store      store_;
    TERegistry registry_;
};

template <PositionalStore Store>
std::ostream& operator<<(std::ostream& os, const Genome<Store>& g) {
    return os << g.render();
}

// ── Named backends ──────────────────────────────────────────────────────────
using ListGenome       = Genome<ContiguousStore>;
using LinkedListGenome = Genome<LinkedStore>;

static_assert(GenomeModel<ListGenome>);
static_assert(GenomeModel<LinkedListGenome>);

}  // namespace tesim
