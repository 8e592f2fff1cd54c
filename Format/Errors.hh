#pragma once

#include <stdint.h>

#include <stdexcept>
#include <string>


// structural problems; decoding of the whole file stops when one of these is
// thrown
class whisper_format_error : public std::runtime_error {
public:
  whisper_format_error(const std::string& what, uint64_t offset);
  virtual ~whisper_format_error() = default;

  uint64_t offset;
};

// the buffer is shorter than a declared field or region requires.
// expected_size is the buffer length the field needs; actual_size is the
// buffer's real length
class truncated_data : public whisper_format_error {
public:
  truncated_data(const std::string& what, uint64_t offset,
      uint64_t expected_size, uint64_t actual_size);
  virtual ~truncated_data() = default;

  uint64_t expected_size;
  uint64_t actual_size;
};

// nonsensical header values (zero or huge archive count, zero-sized archives)
class invalid_header : public whisper_format_error {
public:
  invalid_header(const std::string& what, uint64_t offset);
  virtual ~invalid_header() = default;
};

// archive descriptors that contradict each other (order, overlap)
class corrupt_header : public whisper_format_error {
public:
  corrupt_header(const std::string& what, uint64_t offset);
  virtual ~corrupt_header() = default;
};
