#include "CSVRenderer.hh"

#include <inttypes.h>

#include <stdexcept>

#include <phosg/Strings.hh>

using namespace std;


const int64_t CSVRenderer::ALL_ARCHIVES;

CSVRenderer::CSVRenderer(FILE* stream, GapPolicy gap_policy,
    int64_t archive_index) : Renderer(stream), gap_policy(gap_policy),
    archive_index(archive_index) {
  if ((this->archive_index < 0) && (this->archive_index != ALL_ARCHIVES)) {
    throw invalid_argument(string_printf("invalid archive index %" PRId64,
        this->archive_index));
  }
}

void CSVRenderer::render_header(const Header& header, size_t file_size) const {
  fprintf(this->stream, "# aggregation_method=%s max_retention=%" PRIu64
      " x_files_factor=%g file_size=%zu\n",
      header.metadata.aggregation_method.name().c_str(),
      header.metadata.max_retention, header.metadata.x_files_factor, file_size);
  for (const auto& archive : header.archives) {
    fprintf(this->stream, "# archive=%" PRIu32 " offset=%" PRIu32
        " seconds_per_point=%" PRIu32 " points=%" PRIu32 "\n", archive.index,
        archive.offset, archive.seconds_per_point, archive.points);
  }
}

void CSVRenderer::render_file(const DecodedFile& file) const {
  if ((this->archive_index != ALL_ARCHIVES) &&
      (static_cast<uint64_t>(this->archive_index) >= file.archives.size())) {
    throw out_of_range(string_printf("archive %" PRId64
        " doesn\'t exist (file has %zu archives)", this->archive_index,
        file.archives.size()));
  }

  fprintf(this->stream, "archive,timestamp,value\n");
  for (const auto& archive : file.archives) {
    if ((this->archive_index != ALL_ARCHIVES) &&
        (archive.metadata.index != this->archive_index)) {
      continue;
    }
    for (const auto& pt : points_for_gap_policy(archive, this->gap_policy)) {
      fprintf(this->stream, "%" PRIu32 ",%" PRIu64 ",%.17g\n",
          archive.metadata.index, pt.timestamp, pt.value);
    }
  }
}
