
#include <stdlib.h> // abort

#include "shl/assert.hpp"
#include "shl/error.hpp"
#include "shl/memory.hpp"
#include "shl/print.hpp"
#include "pup/region.hpp"

u32 read_be_u32(const u8 *data)
{
    return ((u32)data[0] << 24)
         | ((u32)data[1] << 16)
         | ((u32)data[2] << 8)
         |  (u32)data[3];
}

u64 read_be_u64(const u8 *data)
{
    return ((u64)read_be_u32(data) << 32) | (u64)read_be_u32(data + 4);
}

void write_be_u32(u8 *out, u32 value)
{
    out[0] = (u8)(value >> 24);
    out[1] = (u8)(value >> 16);
    out[2] = (u8)(value >> 8);
    out[3] = (u8)value;
}

void write_be_u64(u8 *out, u64 value)
{
    write_be_u32(out, (u32)(value >> 32));
    write_be_u32(out + 4, (u32)value);
}

[[noreturn]] static void _overflow(const char *op, u64 a, u64 b)
{
    tprint(stderr_handle(), "fatal: % of % and % overflows\n", op, a, b);
    abort();
}

u64 checked_add(u64 a, u64 b)
{
    u64 ret;

    if (__builtin_add_overflow(a, b, &ret))
        _overflow("addition", a, b);

    return ret;
}

u64 checked_mul(u64 a, u64 b)
{
    u64 ret;

    if (__builtin_mul_overflow(a, b, &ret))
        _overflow("multiplication", a, b);

    return ret;
}

u64 align_up(u64 value, u64 alignment)
{
    assert(alignment > 0 && (alignment & (alignment - 1)) == 0);

    return checked_add(value, alignment - 1) & ~(alignment - 1);
}

bool pup_signature_kind_from_code(u32 code, pup_signature_kind *out, error *err)
{
    assert(out != nullptr);

    switch (code)
    {
    case (u32)pup_signature_kind::HmacSha1:
        *out = pup_signature_kind::HmacSha1;
        return true;
    case (u32)pup_signature_kind::HmacSha256:
        *out = pup_signature_kind::HmacSha256;
        return true;
    default:
        format_error(err, PUP_ERROR_INVALID_SIGNATURE_KIND, "region_decode: signature kind % is invalid", code);
        return false;
    }
}

static bool _check_region_size(s64 size, s64 expected, error *err)
{
    if (size != expected)
    {
        format_error(err, PUP_ERROR_UNDERSIZED, "region_decode: pup content (%x) does not match region size (%x)", size, expected);
        return false;
    }

    return true;
}

bool pup_region_decode(const u8 *data, s64 size, pup_metadata *out, error *err)
{
    assert(data != nullptr);
    assert(out != nullptr);

    if (!_check_region_size(size, pup_metadata::encoded_size, err))
        return false;

    if (compare_memory(data, pup_magic, PUP_MAGIC_SIZE) != 0)
    {
        format_error(err, PUP_ERROR_INVALID_MAGIC, "region_decode: invalid pup magic %x", read_be_u64(data));
        return false;
    }

    u64 package_version = read_be_u64(data + 0x08);

    if (package_version != PUP_PACKAGE_VERSION)
    {
        format_error(err, PUP_ERROR_UNSUPPORTED_PACKAGE_VERSION, "region_decode: package version % is unsupported", package_version);
        return false;
    }

    out->image_version = read_be_u64(data + 0x10);
    out->segment_count = read_be_u64(data + 0x18);
    out->header_size   = read_be_u64(data + 0x20);
    out->data_size     = read_be_u64(data + 0x28);

    return true;
}

bool pup_region_decode(const u8 *data, s64 size, pup_segment_entry *out, error *err)
{
    assert(data != nullptr);
    assert(out != nullptr);

    if (!_check_region_size(size, pup_segment_entry::encoded_size, err))
        return false;

    if (!pup_signature_kind_from_code(read_be_u32(data + 0x18), &out->sig_kind, err))
        return false;

    out->id     = read_be_u64(data + 0x00);
    out->offset = read_be_u64(data + 0x08);
    out->size   = read_be_u64(data + 0x10);

    return true;
}

bool pup_region_decode(const u8 *data, s64 size, pup_digest_entry *out, error *err)
{
    assert(data != nullptr);
    assert(out != nullptr);

    if (!_check_region_size(size, pup_digest_entry::encoded_size, err))
        return false;

    out->segment_index = read_be_u64(data);
    copy_memory(data + 0x08, out->digest.data, PUP_DIGEST_SIZE);

    return true;
}

void pup_region_encode(const pup_metadata *meta, u8 *out)
{
    assert(meta != nullptr);
    assert(out != nullptr);

    copy_memory(pup_magic, out, PUP_MAGIC_SIZE);
    write_be_u64(out + 0x08, PUP_PACKAGE_VERSION);
    write_be_u64(out + 0x10, meta->image_version);
    write_be_u64(out + 0x18, meta->segment_count);
    write_be_u64(out + 0x20, meta->header_size);
    write_be_u64(out + 0x28, meta->data_size);
}

void pup_region_encode(const pup_segment_entry *entry, u8 *out)
{
    assert(entry != nullptr);
    assert(out != nullptr);

    write_be_u64(out + 0x00, entry->id);
    write_be_u64(out + 0x08, entry->offset);
    write_be_u64(out + 0x10, entry->size);
    write_be_u32(out + 0x18, (u32)entry->sig_kind);
    write_be_u32(out + 0x1c, 0);
}

void pup_region_encode(const pup_digest_entry *entry, u8 *out)
{
    assert(entry != nullptr);
    assert(out != nullptr);

    write_be_u64(out, entry->segment_index);
    copy_memory(entry->digest.data, out + 0x08, PUP_DIGEST_SIZE);
    fill_memory((void*)(out + 0x08 + PUP_DIGEST_SIZE), 0, 4);
}
