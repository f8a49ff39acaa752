
#include "pup/package.hpp"

const u8 pup_magic[PUP_MAGIC_SIZE] = {'S', 'C', 'E', 'U', 'F', '\0', '\0', '\0'};

const char *pup_signature_kind_name(pup_signature_kind kind)
{
    switch (kind)
    {
    case pup_signature_kind::HmacSha1:   return "HMAC-SHA1";
    case pup_signature_kind::HmacSha256: return "HMAC-SHA256";
    }

    return "unknown";
}
