
#include "shl/assert.hpp"
#include "shl/defer.hpp"
#include "shl/error.hpp"
#include "shl/streams.hpp"

#include "pup/pup_reader.hpp"

bool pup_load_from_path(pup *out, const char *path, error *err)
{
    assert(out != nullptr);
    assert(path != nullptr);

    memory_stream mem{};
    defer { free(&mem); };

    if (!read_entire_file(path, &mem, err))
        return false;

    return pup_decode((const u8*)mem.data, mem.size, out, err);
}

bool pup_segment_load_from_path(pup_segment *out, const char *path, error *err)
{
    assert(out != nullptr);
    assert(path != nullptr);

    memory_stream mem{};
    defer { free(&mem); };

    if (!read_entire_file(path, &mem, err))
        return false;

    pup_segment_set_data(out, mem.data, mem.size);

    return true;
}
