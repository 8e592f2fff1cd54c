#pragma once

#include <stdint.h>
#include <stdio.h>

#include "Renderer.hh"


// writes archive,timestamp,value rows for one archive or all of them
class CSVRenderer : public Renderer {
public:
  static const int64_t ALL_ARCHIVES = -1;

  // throws invalid_argument if archive_index is negative and not ALL_ARCHIVES
  CSVRenderer(FILE* stream, GapPolicy gap_policy,
      int64_t archive_index = ALL_ARCHIVES);
  CSVRenderer(const CSVRenderer& rhs) = delete;
  const CSVRenderer& operator=(const CSVRenderer& rhs) = delete;
  virtual ~CSVRenderer() = default;

  virtual void render_header(const Header& header, size_t file_size) const;
  virtual void render_file(const DecodedFile& file) const;

private:
  GapPolicy gap_policy;
  int64_t archive_index;
};
