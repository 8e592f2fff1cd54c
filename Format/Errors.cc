#include "Errors.hh"

#include <inttypes.h>

#include <phosg/Strings.hh>

using namespace std;


whisper_format_error::whisper_format_error(const string& what, uint64_t offset)
    : runtime_error(what), offset(offset) { }

truncated_data::truncated_data(const string& what, uint64_t offset,
    uint64_t expected_size, uint64_t actual_size)
    : whisper_format_error(string_printf("%s at offset %" PRIu64 " (file must be at least %"
        PRIu64 " bytes, but is %" PRIu64 " bytes)", what.c_str(), offset,
        expected_size, actual_size), offset),
      expected_size(expected_size), actual_size(actual_size) { }

invalid_header::invalid_header(const string& what, uint64_t offset)
    : whisper_format_error(what, offset) { }

corrupt_header::corrupt_header(const string& what, uint64_t offset)
    : whisper_format_error(what, offset) { }
