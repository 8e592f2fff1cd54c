#include "ByteReader.hh"

#include <string.h>

#include <phosg/Encoding.hh>

#include "Errors.hh"

using namespace std;


ByteReader::ByteReader(const string& data)
    : data(reinterpret_cast<const uint8_t*>(data.data())),
      data_size(data.size()) { }

ByteReader::ByteReader(const void* data, size_t size)
    : data(reinterpret_cast<const uint8_t*>(data)), data_size(size) { }

size_t ByteReader::size() const {
  return this->data_size;
}

void ByteReader::check_range(uint64_t offset, uint64_t size,
    const char* what) const {
  // offset + size can't overflow: both come from 32-bit fields or from
  // products of two 32-bit fields
  if ((offset > this->data_size) || (size > this->data_size - offset)) {
    throw truncated_data(what, offset, offset + size, this->data_size);
  }
}

uint32_t ByteReader::read_u32(size_t& offset) const {
  this->check_range(offset, sizeof(uint32_t), "32-bit field");
  uint32_t value;
  memcpy(&value, &this->data[offset], sizeof(value));
  offset += sizeof(value);
  return bswap32(value);
}

float ByteReader::read_f32(size_t& offset) const {
  this->check_range(offset, sizeof(uint32_t), "32-bit float field");
  uint32_t value;
  memcpy(&value, &this->data[offset], sizeof(value));
  offset += sizeof(value);
  return bswap32f(value);
}

double ByteReader::read_f64(size_t& offset) const {
  this->check_range(offset, sizeof(uint64_t), "64-bit float field");
  uint64_t value;
  memcpy(&value, &this->data[offset], sizeof(value));
  offset += sizeof(value);
  return bswap64f(value);
}
