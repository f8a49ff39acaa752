#pragma once

/* pup.hpp

A PS3 update package (pup): an ordered list of segments and an image version.
The order of the segments is their index, which the segment and digest tables
of an encoded pup refer to.

pup_decode and pup_encode convert between pups and their binary form,
the header in between is rebuilt on every encode and never stored.
*/

#include "shl/array.hpp"
#include "shl/error.hpp"

#include "pup/package.hpp"
#include "pup/segment.hpp"

struct pup
{
    array<pup_segment> segments;
    u64 image_version;
};

void init(pup *p);
void free(pup *p);

// decodes a complete pup, segment data is copied out of data.
// out is freed before decoding and is left empty on failure.
bool pup_decode(const u8 *data, s64 size, pup *out, error *err = nullptr);

// out is resized to exactly header size + data size bytes
void pup_encode(const pup *p, array<u8> *out);

// sizes the header and data of p would have when encoded
u64 pup_header_size(const pup *p);
u64 pup_data_size(const pup *p);

// returns nullptr if index is out of bounds
pup_segment *pup_get_segment(pup *p, s64 index);

// index may be anything from 0 to the number of segments (appends).
// on success, p takes ownership of seg and seg is zeroed.
bool pup_insert_segment(pup *p, s64 index, pup_segment *seg, error *err = nullptr);

// indices past the last segment remove the last segment
bool pup_remove_segment(pup *p, s64 index, error *err = nullptr);
