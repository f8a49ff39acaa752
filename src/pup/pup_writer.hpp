#pragma once

/* pup_writer.hpp

Writing pups and raw segment data to files.
 */

#include "shl/error.hpp"
#include "shl/io.hpp"

#include "pup/pup.hpp"

bool pup_write_to_file(const pup *p, const char *out_path, error *err = nullptr);
bool pup_write_to_file(const pup *p, io_handle handle, error *err = nullptr);

// writes only the data of the segment, e.g. to extract it
bool pup_segment_write_to_file(const pup_segment *seg, const char *out_path, error *err = nullptr);
