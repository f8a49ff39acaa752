#pragma once

/* header.hpp

The header of an encoded pup: metadata, segment table, digest table and the
header digest, padded with zeros to a multiple of PUP_HEADER_ALIGNMENT.
Used internally by pup_decode / pup_encode.
*/

#include "shl/error.hpp"

#include "pup/region.hpp"
#include "pup/pup.hpp"

struct pup_header
{
    pup_metadata meta;
    pup_table<pup_segment_entry> segment_table;
    pup_table<pup_digest_entry>  digest_table;
    pup_digest header_digest; // not verified
};

void init(pup_header *header);
void free(pup_header *header);

// padded size of a header with the given number of segments
u64 pup_header_size_for_segments(u64 segment_count);

void pup_metadata_from_segments(const pup_segment *segments, s64 segment_count, u64 image_version, pup_metadata *out);

// data may be a complete pup, only the header is decoded
bool pup_header_decode(const u8 *data, s64 size, pup_header *out, error *err = nullptr);

// builds a new header from the segments of p, segment data is laid out in
// order directly after the header.
void pup_header_derive(const pup *p, pup_header *out);

// writes exactly header->meta.header_size bytes to out
void pup_header_encode(const pup_header *header, u8 *out);
