#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include <string>

#include "../Format/Types.hh"


class Renderer {
public:
  Renderer(const Renderer& rhs) = delete;
  const Renderer& operator=(const Renderer& rhs) = delete;
  virtual ~Renderer() = default;

  // file_size is the size of the data the header was decoded from, which may
  // not match what the header expects
  virtual void render_header(const Header& header, size_t file_size) const = 0;
  virtual void render_file(const DecodedFile& file) const = 0;

protected:
  FILE* stream;

  explicit Renderer(FILE* stream);
};

// YYYY-MM-DD HH:MM:SS, in UTC
std::string format_timestamp(uint64_t timestamp);
