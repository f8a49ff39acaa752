
#include "shl/assert.hpp"
#include "shl/defer.hpp"
#include "shl/error.hpp"
#include "shl/memory.hpp"
#include "pup/header.hpp"
#include "pup/pup.hpp"

void init(pup *p)
{
    assert(p != nullptr);

    fill_memory(p, 0);
    init(&p->segments);
}

void free(pup *p)
{
    assert(p != nullptr);

    free<true>(&p->segments);
    fill_memory(p, 0);
}

// digest entries are not necessarily in segment order
static const pup_digest_entry *_find_digest_entry(const pup_header *header, u64 segment_index)
{
    for (s64 i = 0; i < header->digest_table.entries.size; ++i)
    {
        const pup_digest_entry *entry = header->digest_table.entries.data + i;

        if (entry->segment_index == segment_index)
            return entry;
    }

    return nullptr;
}

static bool _decode_segments(const u8 *data, s64 size, const pup_header *header, pup *out, error *err)
{
    for (s64 i = 0; i < header->segment_table.entries.size; ++i)
    {
        const pup_segment_entry *entry = header->segment_table.entries.data + i;
        const pup_digest_entry *digest_entry = _find_digest_entry(header, (u64)i);

        if (digest_entry == nullptr)
        {
            format_error(err, PUP_ERROR_MISSING_DIGEST, "pup_decode: digest for segment % is missing", i);
            return false;
        }

        if (entry->offset > (u64)size || entry->size > (u64)size - entry->offset)
        {
            format_error(err, PUP_ERROR_MISSING_DATA, "pup_decode: data for segment % is missing (%x bytes at %x, pup content is %x)", i, entry->size, entry->offset, size);
            return false;
        }

        pup_segment *seg = add_at_end(&out->segments);
        init(seg);
        seg->id = entry->id;
        seg->sig_kind = entry->sig_kind;
        copy_memory(digest_entry->digest.data, seg->digest.data, PUP_DIGEST_SIZE);
        pup_segment_set_data(seg, data + entry->offset, (s64)entry->size);
    }

    return true;
}

bool pup_decode(const u8 *data, s64 size, pup *out, error *err)
{
    assert(data != nullptr || size == 0);
    assert(out != nullptr);

    free(out);
    init(out);

    pup_header header{};
    init(&header);
    defer { free(&header); };

    if (!pup_header_decode(data, size, &header, err))
        return false;

    out->image_version = header.meta.image_version;

    if (!_decode_segments(data, size, &header, out, err))
    {
        free(out);
        return false;
    }

    return true;
}

void pup_encode(const pup *p, array<u8> *out)
{
    assert(p != nullptr);
    assert(out != nullptr);

    pup_header header{};
    init(&header);
    defer { free(&header); };

    pup_header_derive(p, &header);

    u64 total_size = checked_add(header.meta.header_size, header.meta.data_size);
    resize(out, (s64)total_size);
    fill_memory((void*)out->data, 0, total_size);

    pup_header_encode(&header, out->data);

    // the table was derived from the segments in the same order
    for (s64 i = 0; i < header.segment_table.entries.size; ++i)
    {
        const pup_segment_entry *entry = header.segment_table.entries.data + i;
        const pup_segment *seg = p->segments.data + i;

        assert(entry->size == (u64)seg->data.size);

        if (entry->size > 0)
            copy_memory(seg->data.data, out->data + entry->offset, entry->size);
    }
}

u64 pup_header_size(const pup *p)
{
    assert(p != nullptr);

    return pup_header_size_for_segments((u64)p->segments.size);
}

u64 pup_data_size(const pup *p)
{
    assert(p != nullptr);

    pup_metadata meta{};
    pup_metadata_from_segments(p->segments.data, p->segments.size, p->image_version, &meta);

    return meta.data_size;
}

pup_segment *pup_get_segment(pup *p, s64 index)
{
    assert(p != nullptr);

    if (index < 0 || index >= p->segments.size)
        return nullptr;

    return p->segments.data + index;
}

bool pup_insert_segment(pup *p, s64 index, pup_segment *seg, error *err)
{
    assert(p != nullptr);
    assert(seg != nullptr);

    if (index < 0 || index > p->segments.size)
    {
        format_error(err, PUP_ERROR_INDEX_OUT_OF_BOUNDS, "insert_segment: index % is out of bounds (% segments)", index, p->segments.size);
        return false;
    }

    add_at_end(&p->segments);

    for (s64 i = p->segments.size - 1; i > index; --i)
        p->segments.data[i] = p->segments.data[i - 1];

    p->segments.data[index] = *seg;
    fill_memory(seg, 0);

    return true;
}

bool pup_remove_segment(pup *p, s64 index, error *err)
{
    assert(p != nullptr);

    if (p->segments.size == 0)
    {
        set_error(err, PUP_ERROR_NO_SEGMENTS, "remove_segment: pup has no segments");
        return false;
    }

    if (index < 0)
    {
        format_error(err, PUP_ERROR_INDEX_OUT_OF_BOUNDS, "remove_segment: index % is out of bounds", index);
        return false;
    }

    if (index >= p->segments.size)
        index = p->segments.size - 1;

    free(p->segments.data + index);
    remove_elements(&p->segments, index, 1);

    return true;
}
