#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "Types.hh"


struct DecodeOptions {
  // current time in seconds, used only to flag points from the future. 0
  // means read the system clock when decoding starts
  uint64_t now;
  size_t max_archive_count;

  DecodeOptions();
};

// decodes an entire whisper file that's already in memory. structural errors
// (truncated_data, invalid_header, corrupt_header) are thrown as soon as
// they're found; advisory problems are returned in the result's anomalies.
// the result doesn't reference data after this returns
DecodedFile decode_whisper_file(const std::string& data,
    const DecodeOptions& options = DecodeOptions());
