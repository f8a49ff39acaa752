#pragma once

/* segment.hpp

A single segment (file) of a pup.
The digest is stored data: a freshly initialized segment has a zero digest,
nothing in this library computes or verifies it.
*/

#include "shl/array.hpp"
#include "pup/package.hpp"

struct pup_segment
{
    u64 id;
    pup_signature_kind sig_kind;
    pup_digest digest;
    array<u8> data;
};

void init(pup_segment *seg);
void free(pup_segment *seg);

// data will be copied
void pup_segment_set_data(pup_segment *seg, const void *data, s64 size);
