#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>


// reads big-endian fields at explicit offsets from a fully-loaded file. the
// read_* functions advance offset past the field; a field that extends past
// the end of the buffer raises truncated_data and leaves offset unchanged.
// the buffer must outlive the reader
class ByteReader {
public:
  ByteReader() = delete;
  explicit ByteReader(const std::string& data);
  ByteReader(const void* data, size_t size);
  ByteReader(const ByteReader& rhs) = default;
  ByteReader& operator=(const ByteReader& rhs) = default;
  ~ByteReader() = default;

  size_t size() const;

  void check_range(uint64_t offset, uint64_t size, const char* what) const;

  uint32_t read_u32(size_t& offset) const;
  float read_f32(size_t& offset) const;
  double read_f64(size_t& offset) const;

private:
  const uint8_t* data;
  size_t data_size;
};
