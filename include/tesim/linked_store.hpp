// =============================================================================
// linked_store.hpp — Circular doubly-linked cell storage backend.
//
// Cells live in an arena (std::vector<Link>) and refer to their neighbours by
// index rather than by pointer, so the ring owns nothing cyclically and the
// store is trivially copyable/movable.  Handle 0 is a sentinel anchor that
// sits "before index 0": sentinel.next is cell 0 and sentinel.prev is the last
// cell.  An empty store is the sentinel linked to itself.
//
// Costs: splicing after a located link is O(1).  There is no random access;
// locating index k walks k+1 links forward from the sentinel every time.
// Cells are never removed (genomes only grow), so the arena has no free list.
// =============================================================================
#pragma once

#include "types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace tesim {

class LinkedStore {
public:
    using Handle = std::size_t;

    /// Handle of the sentinel anchor.
    static constexpr Handle kAnchor = 0;

    // ── Construction ────────────────────────────────────────────────────────
    LinkedStore() { links_.push_back(Link{Nucleotide::Empty, kAnchor, kAnchor}); }

    explicit LinkedStore(Position n) : LinkedStore() {
        if (n < 0) throw std::invalid_argument("Genome size must be non-negative");
        links_.reserve(static_cast<std::size_t>(n) + 1);
        for (Position i = 0; i < n; ++i)
            insert_after(prev(kAnchor), Nucleotide::Empty);
    }

    // ── Link-level access ───────────────────────────────────────────────────

    [[nodiscard]] Handle next(Handle h) const noexcept { return links_[h].next; }
    [[nodiscard]] Handle prev(Handle h) const noexcept { return links_[h].prev; }
    [[nodiscard]] Nucleotide value(Handle h) const noexcept { return links_[h].val; }

    /// Add a new link holding `val` directly after `h`; returns its handle.
    Handle insert_after(Handle h, Nucleotide val) {
        const Handle fresh = links_.size();
        const Handle after = links_[h].next;
        links_.push_back(Link{val, h, after});
        links_[h].next = fresh;
        links_[after].prev = fresh;
        ++size_;
        return fresh;
    }

    /// Handle of the link directly before index `i`.  `i == 0` yields the
    /// anchor, `i == size()` yields the last cell.
    [[nodiscard]] Handle link_before(Position i) const {
        if (i < 0 || i > size())
            throw std::out_of_range("Cell index " + std::to_string(i) + " out of range");
        Handle h = kAnchor;
        for (Position k = 0; k < i; ++k) h = links_[h].next;
        return h;
    }

    // ── PositionalStore concept interface ───────────────────────────────────

    [[nodiscard]] Position size() const noexcept { return size_; }

    [[nodiscard]] Nucleotide at(Position i) const {
        if (i >= size())
            throw std::out_of_range("Cell index " + std::to_string(i) + " out of range");
        return links_[links_[link_before(i)].next].val;
    }

    void insert_run(Position at, Nucleotide symbol, Position count) {
        Handle h = link_before(at);
        if (count <= 0) return;
        // Grow the arena up front so an oversized run fails before any link
        // is spliced.
        links_.reserve(links_.size() + static_cast<std::size_t>(count));
        for (Position k = 0; k < count; ++k) h = insert_after(h, symbol);
    }

    void set_range(Position start, Position end, Nucleotide symbol) {
        if (start > end || end > size())
            throw std::out_of_range("Range [" + std::to_string(start) + ", "
                                    + std::to_string(end) + ") out of range");
        Handle h = links_[link_before(start)].next;
        for (Position k = start; k < end; ++k) {
            links_[h].val = symbol;
            h = links_[h].next;
        }
    }

    [[nodiscard]] std::vector<Nucleotide> to_sequence() const {
        std::vector<Nucleotide> out;
        out.reserve(static_cast<std::size_t>(size_));
        for (Handle h = links_[kAnchor].next; h != kAnchor; h = links_[h].next)
            out.push_back(links_[h].val);
        return out;
    }

    // ── Integrity ───────────────────────────────────────────────────────────

    /// True if walking forward and backward from the anchor both visit
    /// exactly size() cells and every link's neighbours point back at it.
    [[nodiscard]] bool check_links() const noexcept {
        Position fwd = 0;
        for (Handle h = links_[kAnchor].next; h != kAnchor; h = links_[h].next) {
            if (links_[links_[h].next].prev != h) return false;
            if (++fwd > size_) return false;
        }
        Position bwd = 0;
        for (Handle h = links_[kAnchor].prev; h != kAnchor; h = links_[h].prev) {
            if (++bwd > size_) return false;
        }
        return fwd == size_ && bwd == size_;
    }

private:
    struct Link {
        Nucleotide val;
        Handle     prev;
        Handle     next;
    };

    std::vector<Link> links_;   // links_[kAnchor] is the sentinel
    Position          size_ = 0;
};

}  // namespace tesim
