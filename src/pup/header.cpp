
#include "shl/assert.hpp"
#include "shl/error.hpp"
#include "shl/memory.hpp"
#include "pup/header.hpp"

void init(pup_header *header)
{
    assert(header != nullptr);

    fill_memory(header, 0);
    init(&header->segment_table);
    init(&header->digest_table);
}

void free(pup_header *header)
{
    assert(header != nullptr);

    free(&header->segment_table);
    free(&header->digest_table);
    fill_memory(header, 0);
}

u64 pup_header_size_for_segments(u64 segment_count)
{
    u64 size = pup_metadata::encoded_size;
    size = checked_add(size, checked_mul(segment_count, pup_segment_entry::encoded_size));
    size = checked_add(size, checked_mul(segment_count, pup_digest_entry::encoded_size));
    size = checked_add(size, PUP_DIGEST_SIZE);

    return align_up(size, PUP_HEADER_ALIGNMENT);
}

void pup_metadata_from_segments(const pup_segment *segments, s64 segment_count, u64 image_version, pup_metadata *out)
{
    assert(segments != nullptr || segment_count == 0);
    assert(segment_count >= 0);
    assert(out != nullptr);

    u64 data_size = 0;

    for (s64 i = 0; i < segment_count; ++i)
        data_size = checked_add(data_size, (u64)segments[i].data.size);

    out->image_version = image_version;
    out->segment_count = (u64)segment_count;
    out->header_size = pup_header_size_for_segments((u64)segment_count);
    out->data_size = data_size;
}

// checks that length bytes starting at pos are inside the content,
// without overflowing on garbage lengths.
static bool _check_slice(s64 size, s64 pos, u64 length, const char *region, error *err)
{
    if (pos > size || length > (u64)(size - pos))
    {
        format_error(err, PUP_ERROR_UNDERSIZED, "header_decode: pup content (%x) too small for % (%x bytes at %x)", size, region, length, pos);
        return false;
    }

    return true;
}

static bool _table_size(u64 segment_count, s64 entry_size, u64 *out, error *err)
{
    if (__builtin_mul_overflow(segment_count, (u64)entry_size, out))
    {
        format_error(err, PUP_ERROR_UNDERSIZED, "header_decode: segment count % is larger than any pup", segment_count);
        return false;
    }

    return true;
}

bool pup_header_decode(const u8 *data, s64 size, pup_header *out, error *err)
{
    assert(data != nullptr || size == 0);
    assert(size >= 0);
    assert(out != nullptr);

    s64 pos = 0;

    // metadata
    if (!_check_slice(size, pos, pup_metadata::encoded_size, "metadata", err))
        return false;

    if (!pup_region_decode(data + pos, pup_metadata::encoded_size, &out->meta, err))
        return false;

    pos += pup_metadata::encoded_size;

    // segment table
    u64 table_size = 0;

    if (!_table_size(out->meta.segment_count, pup_segment_entry::encoded_size, &table_size, err))
        return false;

    if (!_check_slice(size, pos, table_size, "segment table", err))
        return false;

    if (!pup_table_decode(data + pos, (s64)table_size, &out->segment_table, err))
        return false;

    pos += (s64)table_size;

    // digest table
    if (!_table_size(out->meta.segment_count, pup_digest_entry::encoded_size, &table_size, err))
        return false;

    if (!_check_slice(size, pos, table_size, "digest table", err))
        return false;

    if (!pup_table_decode(data + pos, (s64)table_size, &out->digest_table, err))
        return false;

    pos += (s64)table_size;

    // header digest
    if (!_check_slice(size, pos, PUP_DIGEST_SIZE, "header digest", err))
        return false;

    copy_memory(data + pos, out->header_digest.data, PUP_DIGEST_SIZE);

    return true;
}

void pup_header_derive(const pup *p, pup_header *out)
{
    assert(p != nullptr);
    assert(out != nullptr);

    const pup_segment *segments = p->segments.data;
    s64 count = p->segments.size;

    pup_metadata_from_segments(segments, count, p->image_version, &out->meta);

    resize(&out->segment_table.entries, count);
    resize(&out->digest_table.entries, count);

    u64 offset = out->meta.header_size;

    for (s64 i = 0; i < count; ++i)
    {
        const pup_segment *seg = segments + i;

        pup_segment_entry *entry = out->segment_table.entries.data + i;
        entry->id = seg->id;
        entry->offset = offset;
        entry->size = (u64)seg->data.size;
        entry->sig_kind = seg->sig_kind;

        offset = checked_add(offset, entry->size);

        pup_digest_entry *digest_entry = out->digest_table.entries.data + i;
        digest_entry->segment_index = (u64)i;
        copy_memory(seg->digest.data, digest_entry->digest.data, PUP_DIGEST_SIZE);
    }

    fill_memory(&out->header_digest, 0);
}

void pup_header_encode(const pup_header *header, u8 *out)
{
    assert(header != nullptr);
    assert(out != nullptr);

    s64 pos = 0;

    pup_region_encode(&header->meta, out);
    pos += pup_metadata::encoded_size;

    pup_table_encode(&header->segment_table, out + pos);
    pos += pup_table_encoded_size(&header->segment_table);

    pup_table_encode(&header->digest_table, out + pos);
    pos += pup_table_encoded_size(&header->digest_table);

    copy_memory(header->header_digest.data, out + pos, PUP_DIGEST_SIZE);
    pos += PUP_DIGEST_SIZE;

    // header size was derived from the same tables
    assert((u64)pos <= header->meta.header_size);

    fill_memory((void*)(out + pos), 0, header->meta.header_size - (u64)pos);
}
