#include "SummaryRenderer.hh"

#include <inttypes.h>

using namespace std;


SummaryRenderer::SummaryRenderer(FILE* stream) : Renderer(stream) { }

void SummaryRenderer::render_header(const Header& header,
    size_t file_size) const {
  const auto& metadata = header.metadata;
  uint64_t expected_size = header.expected_file_size();

  if (file_size != expected_size) {
    fprintf(this->stream, "FILE IS CORRUPT!\n");
    fprintf(this->stream, " actual size: %zu\n", file_size);
    fprintf(this->stream, " expected size: %" PRIu64 "\n\n", expected_size);
  }

  fprintf(this->stream, "aggregation_method: %s\n",
      metadata.aggregation_method.name().c_str());
  fprintf(this->stream, "max_retention: %" PRIu64 "\n", metadata.max_retention);
  if (metadata.declared_max_retention != metadata.max_retention) {
    fprintf(this->stream, "declared_max_retention: %" PRIu32 "\n",
        metadata.declared_max_retention);
  }
  fprintf(this->stream, "x_files_factor: %g\n", metadata.x_files_factor);
  fprintf(this->stream, "archive_count: %" PRIu32 "\n", metadata.archive_count);
  fprintf(this->stream, "header_size: %" PRIu64 "\n", header.size());
  fprintf(this->stream, "file_size: %zu\n", file_size);

  for (const auto& archive : header.archives) {
    fprintf(this->stream, "  Archive[index=%" PRIu32 ", offset=%" PRIu32
        ", seconds_per_point=%" PRIu32 ", points=%" PRIu32 ", retention=%"
        PRIu64 "]\n", archive.index, archive.offset, archive.seconds_per_point,
        archive.points, archive.retention());
  }
}

void SummaryRenderer::render_file(const DecodedFile& file) const {
  for (const auto& archive : file.archives) {
    size_t counts[4] = {0, 0, 0, 0};
    for (const auto& slot : archive.slots) {
      counts[static_cast<size_t>(slot.state)]++;
    }
    counts[static_cast<size_t>(SlotState::Misaligned)] += archive.unplaced_points.size();

    fprintf(this->stream, "archive %" PRIu32 ":", archive.metadata.index);
    for (SlotState state : {SlotState::Present, SlotState::Empty,
        SlotState::Stale, SlotState::Misaligned}) {
      fprintf(this->stream, "%s %zu %s", (state == SlotState::Present) ? "" : ",",
          counts[static_cast<size_t>(state)], name_for_slot_state(state));
    }
    if (archive.empty()) {
      fprintf(this->stream, " (never written)\n");
    } else {
      fprintf(this->stream, " from %s to %s\n",
          format_timestamp(archive.slots.front().timestamp).c_str(),
          format_timestamp(archive.slots.back().timestamp).c_str());
    }
  }

  for (const auto& anomaly : file.all_anomalies()) {
    fprintf(this->stream, "warning: %s\n", anomaly.str().c_str());
  }
}
