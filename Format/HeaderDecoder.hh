#pragma once

#include <stddef.h>

#include "ByteReader.hh"
#include "Types.hh"


static const size_t DEFAULT_MAX_ARCHIVE_COUNT = 1024;

// decodes the file header and the archive descriptor table that follows it.
// throws truncated_data if either is cut off, and invalid_header if the
// archive count or any descriptor is nonsensical. the declared max retention
// and x-files-factor are only checked for consistency (see Header::anomalies)
Header decode_header(const ByteReader& r,
    size_t max_archive_count = DEFAULT_MAX_ARCHIVE_COUNT);
