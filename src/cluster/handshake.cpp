#include "troupe/handshake.hpp"

namespace troupe {

LinkResolution resolve_duplicate_link(const NodeId& local, const NodeId& peer,
                                      bool existing_is_initiator) {
    // Existing link was ours: keep it only if we are the greater node.
    // Existing link was theirs: keep it only if they are the greater node.
    if (existing_is_initiator && local < peer) {
        return LinkResolution::ReplaceExisting;
    }
    if (!existing_is_initiator && peer < local) {
        return LinkResolution::ReplaceExisting;
    }
    return LinkResolution::KeepExisting;
}

const char* link_resolution_string(LinkResolution r) {
    switch (r) {
        case LinkResolution::KeepExisting: return "keep-existing";
        case LinkResolution::ReplaceExisting: return "replace-existing";
        default: return "unknown";
    }
}

}  // namespace troupe
