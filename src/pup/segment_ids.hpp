#pragma once

/* segment_ids.hpp

Known segment ids and the file names they stand for.
Only used for display and for guessing ids of inserted files, the pup format
itself does not care about names.
*/

#include "shl/number_types.hpp"

struct pup_segment_id_entry
{
    u64 id;
    const char *name;
};

static const pup_segment_id_entry pup_known_segment_ids[] = {
    { 0x100, "version.txt" },
    { 0x101, "license.xml" },
    { 0x102, "promo_flags.txt" },
    { 0x103, "update_flags.txt" },
    { 0x104, "patch_build.txt" },
    { 0x200, "ps3swu.self" },
    { 0x201, "vsh.tar" },
    { 0x202, "dots.txt" },
    { 0x203, "patch_data.pkg" },
    { 0x300, "update_files.tar" },
    { 0x501, "spkg_hdr.tar" },
    { 0x601, "ps3swu2.self" }
};

enum { PupKnownSegmentIdCount = sizeof(pup_known_segment_ids) / sizeof(pup_segment_id_entry) };

// returns nullptr if the id is not known
const char *pup_segment_id_name(u64 id);

// returns false if no known segment has the given file name
bool pup_segment_id_from_name(const char *name, u64 *out_id);
