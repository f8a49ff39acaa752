#pragma once

#include "shl/io.hpp"

#include "pup/pup.hpp"

// prints image version and a summary of every segment.
// verbose also prints the offset each segment is stored at when encoded.
void pup_print(io_handle h, const pup *p, bool verbose = false);
