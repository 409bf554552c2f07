#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <optional>
#include <tuple>

namespace troupe {

// Unique tag of one add: (origin actor, per-actor counter)
template<typename Actor>
struct Dot {
    Actor actor;
    uint64_t counter = 0;

    bool operator==(const Dot& other) const noexcept {
        return counter == other.counter && actor == other.actor;
    }
    bool operator<(const Dot& other) const noexcept {
        return std::tie(actor, counter) < std::tie(other.actor, other.counter);
    }
};

// Observed-Remove Set, delta-state flavour.
//
// An element is present while it owns at least one add-dot that no tombstone
// covers. Removing an element tombstones exactly the dots this replica has
// observed, so an add carrying a dot the remover never saw survives the merge.
//
// Deltas and full states share one representation: a delta is simply a
// small State. join() is idempotent, commutative and associative.
//
// Tombstones are never compacted.
template<typename T, typename Actor>
class ORSet {
public:
    using DotType = Dot<Actor>;
    using DotSet = std::set<DotType>;

    struct State {
        std::map<T, DotSet> adds;      // live add-dots per element
        std::map<T, DotSet> removes;   // tombstoned dots per element

        bool empty() const noexcept { return adds.empty() && removes.empty(); }

        bool operator==(const State& other) const {
            return adds == other.adds && removes == other.removes;
        }
    };

    using Delta = State;

    explicit ORSet(Actor actor, uint64_t initial_counter = 0)
        : actor_(std::move(actor))
        , counter_(initial_counter)
    {}

    // Tag elem with a fresh dot. Returns the delta to disseminate.
    Delta add(const T& elem) {
        DotType dot{actor_, ++counter_};
        state_.adds[elem].insert(dot);

        Delta delta;
        delta.adds[elem].insert(dot);
        return delta;
    }

    // Tombstone every observed dot of elem. Returns nothing if elem is absent.
    std::optional<Delta> remove(const T& elem) {
        auto it = state_.adds.find(elem);
        if (it == state_.adds.end() || it->second.empty()) {
            return std::nullopt;
        }

        Delta delta;
        delta.removes[elem] = it->second;
        state_.removes[elem].insert(it->second.begin(), it->second.end());
        state_.adds.erase(it);
        return delta;
    }

    // Merge a delta or a full state. Returns true if local state changed.
    bool join(const State& other) {
        return !join_novel(other).empty();
    }

    // Merge and return the part of `other` this replica had not seen yet
    State join_novel(const State& other) {
        State novel;

        // Tombstones first, so a dot that arrives both added and removed
        // never becomes visible.
        for (const auto& [elem, dots] : other.removes) {
            auto& tombstones = state_.removes[elem];
            auto adds_it = state_.adds.find(elem);
            for (const auto& dot : dots) {
                observe(dot);
                if (!tombstones.insert(dot).second) {
                    continue;
                }
                novel.removes[elem].insert(dot);
                if (adds_it != state_.adds.end()) {
                    adds_it->second.erase(dot);
                }
            }
            if (tombstones.empty()) {
                state_.removes.erase(elem);
            }
            if (adds_it != state_.adds.end() && adds_it->second.empty()) {
                state_.adds.erase(adds_it);
            }
        }

        for (const auto& [elem, dots] : other.adds) {
            auto tomb_it = state_.removes.find(elem);
            for (const auto& dot : dots) {
                observe(dot);
                if (tomb_it != state_.removes.end() && tomb_it->second.count(dot)) {
                    continue;
                }
                if (state_.adds[elem].insert(dot).second) {
                    novel.adds[elem].insert(dot);
                }
            }
            auto adds_it = state_.adds.find(elem);
            if (adds_it != state_.adds.end() && adds_it->second.empty()) {
                state_.adds.erase(adds_it);
            }
        }

        return novel;
    }

    bool contains(const T& elem) const {
        auto it = state_.adds.find(elem);
        return it != state_.adds.end() && !it->second.empty();
    }

    std::set<T> elements() const {
        std::set<T> result;
        for (const auto& [elem, dots] : state_.adds) {
            if (!dots.empty()) {
                result.insert(elem);
            }
        }
        return result;
    }

    const State& state() const noexcept { return state_; }
    const Actor& actor() const noexcept { return actor_; }
    uint64_t counter() const noexcept { return counter_; }

private:
    Actor actor_;
    uint64_t counter_;
    State state_;

    // Never hand out a dot of our own that a peer has already seen
    void observe(const DotType& dot) {
        if (dot.actor == actor_ && dot.counter > counter_) {
            counter_ = dot.counter;
        }
    }
};

}  // namespace troupe
