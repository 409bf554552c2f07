#pragma once

#include "troupe/types.hpp"

namespace troupe {

// Which of two links between the same pair of nodes survives
enum class LinkResolution {
    KeepExisting,    // close the new connection
    ReplaceExisting, // close the existing connection, keep the new one
};

// Decide between an established link and a second one that just completed
// its handshake with the same peer. Both endpoints evaluate this with their
// own view of the existing link and reach the same answer: the link
// initiated by the greater node survives.
LinkResolution resolve_duplicate_link(const NodeId& local, const NodeId& peer,
                                      bool existing_is_initiator);

const char* link_resolution_string(LinkResolution r);

}  // namespace troupe
