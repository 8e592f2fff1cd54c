#pragma once

#include <stdio.h>

#include "Renderer.hh"


class SummaryRenderer : public Renderer {
public:
  explicit SummaryRenderer(FILE* stream);
  SummaryRenderer(const SummaryRenderer& rhs) = delete;
  const SummaryRenderer& operator=(const SummaryRenderer& rhs) = delete;
  virtual ~SummaryRenderer() = default;

  virtual void render_header(const Header& header, size_t file_size) const;
  virtual void render_file(const DecodedFile& file) const;
};
