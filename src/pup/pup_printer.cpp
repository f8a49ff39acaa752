
#include "shl/assert.hpp"
#include "shl/print.hpp"
#include "pup/segment_ids.hpp"
#include "pup/pup_printer.hpp"

static void _print_digest(io_handle h, const pup_digest *digest)
{
    for (s64 i = 0; i < PUP_DIGEST_SIZE; ++i)
        tprint(h, "%02x", (u32)digest->data[i]);
}

void pup_print(io_handle h, const pup *p, bool verbose)
{
    assert(p != nullptr);

    tprint(h, "image version: 0x%x\n", p->image_version);
    tprint(h, "% segments\n", p->segments.size);

    u64 offset = pup_header_size(p);

    for (s64 i = 0; i < p->segments.size; ++i)
    {
        const pup_segment *seg = p->segments.data + i;
        const char *name = pup_segment_id_name(seg->id);

        if (name != nullptr)
            tprint(h, "\n  [%]\n", name);
        else
            tprint(h, "\n  [id 0x%x]\n", seg->id);

        tprint(h, "    size:   % bytes\n", seg->data.size);

        if (verbose)
            tprint(h, "    offset: 0x%08x\n", offset);

        tprint(h, "    digest: ");
        _print_digest(h, &seg->digest);
        tprint(h, " (%)\n", pup_signature_kind_name(seg->sig_kind));

        offset += (u64)seg->data.size;
    }
}
