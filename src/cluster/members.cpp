#include "troupe/members.hpp"
#include <chrono>

namespace troupe {

namespace {

uint64_t incarnation() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

}  // namespace

Members::Members(const NodeId& local)
    : Members(local, incarnation())
{}

Members::Members(const NodeId& local, uint64_t initial_counter)
    : local_(local)
    , orset_(local.to_string(), initial_counter)
{
    orset_.add(local_);
}

MemberDelta Members::add(const NodeId& node) {
    return orset_.add(node);
}

std::optional<MemberDelta> Members::leave(const NodeId& node) {
    return orset_.remove(node);
}

bool Members::join(const MemberState& state) {
    return orset_.join(state);
}

MemberDelta Members::join_novel(const MemberState& state) {
    return orset_.join_novel(state);
}

}  // namespace troupe
