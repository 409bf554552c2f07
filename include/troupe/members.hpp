#pragma once

#include "troupe/types.hpp"
#include "troupe/orset.hpp"
#include <optional>
#include <set>
#include <string>

namespace troupe {

using MemberSet = ORSet<NodeId, std::string>;
using MemberState = MemberSet::State;
using MemberDelta = MemberSet::Delta;

// Replicated cluster membership of one node.
//
// Dots are tagged with the local node's "name@address". The replica starts
// with the local node as a member, and its counter starts at the wall-clock
// microsecond so a restarted node never reissues a dot it handed out in an
// earlier life.
class Members {
public:
    explicit Members(const NodeId& local);
    Members(const NodeId& local, uint64_t initial_counter);

    // Returns the delta to broadcast
    MemberDelta add(const NodeId& node);

    // Tombstone delta, or nothing if node is not currently a member
    std::optional<MemberDelta> leave(const NodeId& node);

    // Merge a delta or a snapshot; true if local state changed
    bool join(const MemberState& state);

    // Merge and return only what was new here (empty if nothing)
    MemberDelta join_novel(const MemberState& state);

    std::set<NodeId> all() const { return orset_.elements(); }
    bool contains(const NodeId& node) const { return orset_.contains(node); }

    // Full state used to bootstrap a newly connected peer
    MemberState snapshot() const { return orset_.state(); }

    const NodeId& local() const noexcept { return local_; }

private:
    NodeId local_;
    MemberSet orset_;
};

}  // namespace troupe
