// =============================================================================
// te_registry.hpp — Registry that maps TEID → current position range.
//
// Only active TEs have an entry; disabling a TE erases it for good.  Ids come
// from an owned counter that starts at 1 and is never rewound, so an id is
// never reused even after its TE has been disabled.
// =============================================================================
#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tesim {

/// Verdict returned by a for_each_mut visitor.
enum class RegistryAction : std::uint8_t {
    Keep,
    Erase
};

class TERegistry {
public:
    TERegistry() = default;

    // ── Id allocation ───────────────────────────────────────────────────────
    [[nodiscard]] TEID next_id() noexcept { return ++last_id_; }

    /// Number of ids handed out so far (== the most recent id).
    [[nodiscard]] TEID ids_issued() const noexcept { return last_id_; }

    // ── Query ───────────────────────────────────────────────────────────────
    [[nodiscard]] std::optional<TERange> get(TEID id) const {
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool contains(TEID id) const { return entries_.count(id) != 0; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Active ids in ascending order.
    [[nodiscard]] std::vector<TEID> ids() const {
        std::vector<TEID> out;
        out.reserve(entries_.size());
        for (const auto& [id, range] : entries_) out.push_back(id);
        return out;
    }

    [[nodiscard]] const std::map<TEID, TERange>& entries() const noexcept { return entries_; }

    // ── Mutation ────────────────────────────────────────────────────────────
    void insert(TEID id, TERange range) {
        if (id == kNoTE)
            throw std::invalid_argument("TE id 0 is reserved");
        if (range.start >= range.end)
            throw std::invalid_argument("TE " + std::to_string(id) + " has an empty range");
        if (!entries_.emplace(id, range).second)
            throw std::invalid_argument("TE " + std::to_string(id) + " is already registered");
    }

    std::optional<TERange> remove(TEID id) {
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        TERange r = it->second;
        entries_.erase(it);
        return r;
    }

    /// Visit every entry in ascending id order.  The visitor may rewrite the
    /// range in place and returns Erase to drop the entry.
    template <typename Fn>
    void for_each_mut(Fn&& fn) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (fn(it->first, it->second) == RegistryAction::Erase)
                it = entries_.erase(it);
            else
                ++it;
        }
    }

private:
    std::map<TEID, TERange> entries_;
    TEID                    last_id_ = kNoTE;
};

}  // namespace tesim
