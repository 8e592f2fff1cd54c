#include "FileLoader.hh"

#include <stdint.h>
#include <zlib.h>

#include <stdexcept>

#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>

using namespace std;


bool is_gzip_data(const string& data) {
  return (data.size() >= 2) &&
         (static_cast<uint8_t>(data[0]) == 0x1F) &&
         (static_cast<uint8_t>(data[1]) == 0x8B);
}

string gunzip_data(const string& data) {
  z_stream zs;
  zs.zalloc = Z_NULL;
  zs.zfree = Z_NULL;
  zs.opaque = Z_NULL;
  zs.next_in = Z_NULL;
  zs.avail_in = 0;

  // 16 + MAX_WBITS = expect a gzip header and trailer
  int zret = inflateInit2(&zs, 16 + MAX_WBITS);
  if (zret != Z_OK) {
    throw runtime_error(string_printf("can\'t initialize zlib: %s", zError(zret)));
  }

  string ret;
  string buffer(0x10000, '\0');
  size_t input_offset = 0;
  do {
    // avail_in is 32 bits wide, so feed huge inputs in pieces
    if (zs.avail_in == 0 && input_offset < data.size()) {
      size_t chunk_size = data.size() - input_offset;
      if (chunk_size > 0x40000000) {
        chunk_size = 0x40000000;
      }
      zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + input_offset));
      zs.avail_in = chunk_size;
      input_offset += chunk_size;
    }

    zs.next_out = reinterpret_cast<Bytef*>(const_cast<char*>(buffer.data()));
    zs.avail_out = buffer.size();
    zret = inflate(&zs, Z_NO_FLUSH);
    if ((zret != Z_OK) && (zret != Z_STREAM_END)) {
      string message = zs.msg ? zs.msg : zError(zret);
      inflateEnd(&zs);
      throw runtime_error("can\'t decompress data: " + message);
    }
    ret.append(buffer.data(), buffer.size() - zs.avail_out);

    bool input_remaining = (zs.avail_in != 0) || (input_offset < data.size());
    if ((zret == Z_OK) && !input_remaining && (zs.avail_out != 0)) {
      inflateEnd(&zs);
      throw runtime_error("can\'t decompress data: stream is truncated");
    }

    // concatenated gzip members decompress to the concatenation of their
    // contents; anything after a member that isn't another member fails above
    if ((zret == Z_STREAM_END) && input_remaining) {
      zret = inflateReset(&zs);
      if (zret != Z_OK) {
        inflateEnd(&zs);
        throw runtime_error(string_printf("can\'t reset zlib: %s", zError(zret)));
      }
    }
  } while (zret != Z_STREAM_END);

  inflateEnd(&zs);
  return ret;
}

string load_whisper_data(const string& filename) {
  string data = load_file(filename);
  if (is_gzip_data(data)) {
    log(INFO, "%s is gzip-compressed; decompressing %zu bytes",
        filename.c_str(), data.size());
    data = gunzip_data(data);
  }
  return data;
}
