#pragma once

/* pup_reader.hpp

Loading pups from files.
The whole file is read into memory, decoded and released again, the loaded
pup does not refer to the file contents.
*/

#include "shl/error.hpp"

#include "pup/pup.hpp"

// out is left empty if the file cannot be read or is not a valid pup
bool pup_load_from_path(pup *out, const char *path, error *err = nullptr);

// reads an entire file into a segment, e.g. to insert it into a pup
bool pup_segment_load_from_path(pup_segment *out, const char *path, error *err = nullptr);
