
#include "shl/assert.hpp"
#include "shl/array.hpp"
#include "shl/defer.hpp"
#include "shl/error.hpp"
#include "pup/pup_writer.hpp"

static bool _write_all(io_handle h, const void *data, s64 size, error *err)
{
    s64 written = io_write(h, (const char*)data, size, err);

    if (written < 0)
        return false;

    if (written != size)
    {
        format_error(err, PUP_ERROR_IO, "write: only wrote %x of %x bytes", written, size);
        return false;
    }

    return true;
}

bool pup_write_to_file(const pup *p, const char *out_path, error *err)
{
    assert(p != nullptr);
    assert(out_path != nullptr);

    io_handle h = io_open(out_path, open_mode::WriteTrunc, err);

    if (h == INVALID_IO_HANDLE)
        return false;

    defer { io_close(h); };

    return pup_write_to_file(p, h, err);
}

bool pup_write_to_file(const pup *p, io_handle h, error *err)
{
    assert(p != nullptr);
    assert(h != INVALID_IO_HANDLE);

    array<u8> content{};
    init(&content);
    defer { free(&content); };

    pup_encode(p, &content);

    return _write_all(h, content.data, content.size, err);
}

bool pup_segment_write_to_file(const pup_segment *seg, const char *out_path, error *err)
{
    assert(seg != nullptr);
    assert(out_path != nullptr);

    io_handle h = io_open(out_path, open_mode::WriteTrunc, err);

    if (h == INVALID_IO_HANDLE)
        return false;

    defer { io_close(h); };

    return _write_all(h, seg->data.data, seg->data.size, err);
}
