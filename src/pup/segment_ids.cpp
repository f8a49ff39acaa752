
#include "shl/assert.hpp"
#include "shl/string.hpp"
#include "pup/segment_ids.hpp"

const char *pup_segment_id_name(u64 id)
{
    for (s64 i = 0; i < PupKnownSegmentIdCount; ++i)
        if (pup_known_segment_ids[i].id == id)
            return pup_known_segment_ids[i].name;

    return nullptr;
}

bool pup_segment_id_from_name(const char *name, u64 *out_id)
{
    assert(name != nullptr);
    assert(out_id != nullptr);

    for (s64 i = 0; i < PupKnownSegmentIdCount; ++i)
    {
        if (compare_strings(pup_known_segment_ids[i].name, name) == 0)
        {
            *out_id = pup_known_segment_ids[i].id;
            return true;
        }
    }

    return false;
}
