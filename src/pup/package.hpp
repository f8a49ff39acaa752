
#pragma once

#include "shl/number_types.hpp"

/* pup structure (all integers big endian):
 * [metadata
 *   8 bytes magic "SCEUF\0\0\0"
 *   8 bytes package version
 *   8 bytes image version
 *   8 bytes segment count (N)
 *   8 bytes header size
 *   8 bytes data size
 * ]
 * [segment table
 *   [entry 1
 *     8 bytes segment id
 *     8 bytes data offset, from start of the pup
 *     8 bytes data size
 *     4 bytes signature kind
 *     4 bytes reserved
 *   ]
 *   [entry 2 ... N]
 * ]
 * [digest table
 *   [entry 1
 *     8 bytes segment index
 *     20 bytes digest
 *     4 bytes reserved
 *   ]
 *   [entry 2 ... N]
 * ]
 * [header digest, 20 bytes]
 * [padding to the next multiple of 16 bytes]
 * [segment data, data size bytes]
 */

#define PUP_MAGIC_SIZE       8
#define PUP_PACKAGE_VERSION  1
#define PUP_DIGEST_SIZE      0x14
#define PUP_HEADER_ALIGNMENT 0x10

extern const u8 pup_magic[PUP_MAGIC_SIZE];

enum class pup_signature_kind : u32
{
    HmacSha1   = 0,
    HmacSha256 = 2
};

struct pup_digest
{
    u8 data[PUP_DIGEST_SIZE];
};

enum pup_error_code
{
    PUP_ERROR_UNDERSIZED                  = 1,
    PUP_ERROR_INVALID_MAGIC               = 2,
    PUP_ERROR_UNSUPPORTED_PACKAGE_VERSION = 3,
    PUP_ERROR_INVALID_SIGNATURE_KIND      = 4,
    PUP_ERROR_MISSING_DIGEST              = 5,
    PUP_ERROR_MISSING_DATA                = 6,
    PUP_ERROR_INDEX_OUT_OF_BOUNDS         = 7,
    PUP_ERROR_NO_SEGMENTS                 = 8,
    PUP_ERROR_IO                          = 9
};

struct pup_metadata
{
    u64 image_version;
    u64 segment_count;
    u64 header_size;
    u64 data_size;

    static constexpr s64 encoded_size = 0x30;
};

struct pup_segment_entry
{
    u64 id;
    u64 offset;
    u64 size;
    pup_signature_kind sig_kind;

    static constexpr s64 encoded_size = 0x20;
};

struct pup_digest_entry
{
    u64 segment_index;
    pup_digest digest;

    static constexpr s64 encoded_size = 0x20;
};

const char *pup_signature_kind_name(pup_signature_kind kind);
