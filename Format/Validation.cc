#include "Validation.hh"

#include <inttypes.h>

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;


void validate_archive_layout(const Header& header) {
  if (header.archives.size() != header.metadata.archive_count) {
    throw corrupt_header(string_printf("header declares %" PRIu32
        " archives but %zu descriptors were decoded",
        header.metadata.archive_count, header.archives.size()), 12);
  }

  uint64_t header_size = header.size();
  for (size_t x = 0; x < header.archives.size(); x++) {
    const auto& archive = header.archives[x];
    uint64_t descriptor_offset = FILE_HEADER_SIZE + x * ARCHIVE_HEADER_SIZE;

    if (archive.offset < header_size) {
      throw corrupt_header(string_printf(
          "archive %zu begins at offset %" PRIu32 ", inside the file header (%"
          PRIu64 " bytes)", x, archive.offset, header_size), descriptor_offset);
    }

    if (x == 0) {
      continue;
    }
    const auto& previous_archive = header.archives[x - 1];

    if (archive.seconds_per_point == previous_archive.seconds_per_point) {
      throw corrupt_header(string_printf(
          "archive %zu has the same precision as a previous archive", x),
          descriptor_offset);
    }
    if (archive.seconds_per_point < previous_archive.seconds_per_point) {
      throw corrupt_header(string_printf(
          "archive %zu is out of order (%" PRIu32 " seconds per point after %"
          PRIu32 ")", x, archive.seconds_per_point,
          previous_archive.seconds_per_point), descriptor_offset);
    }
    if (archive.retention() < previous_archive.retention()) {
      throw corrupt_header(string_printf(
          "archive %zu covers shorter time than higher precisions (%" PRIu64
          " seconds after %" PRIu64 ")", x, archive.retention(),
          previous_archive.retention()), descriptor_offset);
    }
    if (archive.offset < previous_archive.end_offset()) {
      throw corrupt_header(string_printf(
          "archive %zu begins at offset %" PRIu32 ", before the end of archive %zu (%"
          PRIu64 ")", x, archive.offset, x - 1, previous_archive.end_offset()),
          descriptor_offset);
    }
  }
}

void validate_archive_bounds(const ArchiveMetadata& archive,
    size_t buffer_size) {
  if (archive.end_offset() > buffer_size) {
    throw truncated_data(string_printf("archive %" PRIu32
        " extends beyond end of file", archive.index), archive.offset,
        archive.end_offset(), buffer_size);
  }
}

vector<Anomaly> check_file_size(const Header& header, size_t buffer_size) {
  vector<Anomaly> ret;
  uint64_t expected_size = header.size();
  for (const auto& archive : header.archives) {
    if (archive.end_offset() > expected_size) {
      expected_size = archive.end_offset();
    }
  }
  if (buffer_size > expected_size) {
    ret.emplace_back(AnomalyType::TrailingData, -1, expected_size,
        buffer_size - expected_size, string_printf("%" PRIu64
          " bytes follow the last archive", buffer_size - expected_size));
  }
  return ret;
}
