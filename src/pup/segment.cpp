
#include "shl/assert.hpp"
#include "shl/memory.hpp"
#include "pup/segment.hpp"

void init(pup_segment *seg)
{
    assert(seg != nullptr);

    fill_memory(seg, 0);
    seg->sig_kind = pup_signature_kind::HmacSha1;
    init(&seg->data);
}

void free(pup_segment *seg)
{
    assert(seg != nullptr);

    free(&seg->data);
    fill_memory(seg, 0);
}

void pup_segment_set_data(pup_segment *seg, const void *data, s64 size)
{
    assert(seg != nullptr);
    assert(data != nullptr || size == 0);
    assert(size >= 0);

    resize(&seg->data, size);

    if (size > 0)
        copy_memory(data, seg->data.data, size);
}
