#pragma once

/* region.hpp

Fixed size regions of a pup (metadata, segment entries, digest entries) and
pup_table, a tightly packed sequence of one kind of region.

Every region type T has a constant T::encoded_size, is decoded from exactly
T::encoded_size bytes with pup_region_decode and encoded to exactly
T::encoded_size bytes with pup_region_encode.
You probably want pup_decode / pup_encode from pup.hpp instead of these.
*/

#include "shl/assert.hpp"
#include "shl/array.hpp"
#include "shl/error.hpp"

#include "pup/package.hpp"

u32 read_be_u32(const u8 *data);
u64 read_be_u64(const u8 *data);
void write_be_u32(u8 *out, u32 value);
void write_be_u64(u8 *out, u64 value);

// both of these terminate the program on overflow
u64 checked_add(u64 a, u64 b);
u64 checked_mul(u64 a, u64 b);

// alignment must be a power of two
u64 align_up(u64 value, u64 alignment);

bool pup_signature_kind_from_code(u32 code, pup_signature_kind *out, error *err = nullptr);

bool pup_region_decode(const u8 *data, s64 size, pup_metadata *out, error *err = nullptr);
bool pup_region_decode(const u8 *data, s64 size, pup_segment_entry *out, error *err = nullptr);
bool pup_region_decode(const u8 *data, s64 size, pup_digest_entry *out, error *err = nullptr);

void pup_region_encode(const pup_metadata *meta, u8 *out);
void pup_region_encode(const pup_segment_entry *entry, u8 *out);
void pup_region_encode(const pup_digest_entry *entry, u8 *out);

template<typename T>
struct pup_table
{
    array<T> entries;
};

template<typename T>
inline void init(pup_table<T> *table)
{
    assert(table != nullptr);

    init(&table->entries);
}

template<typename T>
inline void free(pup_table<T> *table)
{
    assert(table != nullptr);

    free(&table->entries);
}

template<typename T>
inline s64 pup_table_encoded_size(const pup_table<T> *table)
{
    return table->entries.size * T::encoded_size;
}

// size must be an exact multiple of T::encoded_size.
// the number of entries is size / T::encoded_size, the caller decides how
// many bytes belong to the table.
template<typename T>
bool pup_table_decode(const u8 *data, s64 size, pup_table<T> *out, error *err = nullptr)
{
    assert(out != nullptr);
    assert(data != nullptr || size == 0);
    assert(size >= 0);

    if (size % T::encoded_size != 0)
    {
        format_error(err, PUP_ERROR_UNDERSIZED, "table_decode: table size (%x) is not a multiple of entry size (%x)", size, T::encoded_size);
        return false;
    }

    s64 count = size / T::encoded_size;
    resize(&out->entries, count);

    for (s64 i = 0; i < count; ++i)
        if (!pup_region_decode(data + i * T::encoded_size, T::encoded_size, out->entries.data + i, err))
            return false;

    return true;
}

// out must have space for pup_table_encoded_size(table) bytes
template<typename T>
void pup_table_encode(const pup_table<T> *table, u8 *out)
{
    assert(table != nullptr);
    assert(out != nullptr);

    for (s64 i = 0; i < table->entries.size; ++i)
        pup_region_encode(table->entries.data + i, out + i * T::encoded_size);
}
