#include "HeaderDecoder.hh"

#include <inttypes.h>
#include <math.h>

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;


Header decode_header(const ByteReader& r, size_t max_archive_count) {
  r.check_range(0, FILE_HEADER_SIZE, "file header");

  Header ret;
  size_t offset = 0;
  uint32_t aggregation_code = r.read_u32(offset);
  ret.metadata.aggregation_method = AggregationMethod::from_code(aggregation_code);
  ret.metadata.declared_max_retention = r.read_u32(offset);
  ret.metadata.x_files_factor = r.read_f32(offset);
  size_t archive_count_offset = offset;
  ret.metadata.archive_count = r.read_u32(offset);

  uint32_t archive_count = ret.metadata.archive_count;
  if (archive_count == 0) {
    throw invalid_header("file has no archives", archive_count_offset);
  }
  if (archive_count > max_archive_count) {
    throw invalid_header(string_printf("file declares %" PRIu32
        " archives (limit is %zu)", archive_count, max_archive_count),
        archive_count_offset);
  }
  // every archive needs a descriptor and at least one point, all addressable
  // by 32-bit offsets
  if (FILE_HEADER_SIZE + archive_count * (ARCHIVE_HEADER_SIZE + POINT_SIZE) >
      0x100000000ULL) {
    throw invalid_header(string_printf("file declares %" PRIu32
        " archives, which can\'t fit in a 32-bit address space", archive_count),
        archive_count_offset);
  }

  r.check_range(FILE_HEADER_SIZE, archive_count * ARCHIVE_HEADER_SIZE,
      "archive descriptor table");

  uint64_t max_retention = 0;
  ret.archives.reserve(archive_count);
  for (uint32_t x = 0; x < archive_count; x++) {
    size_t descriptor_offset = offset;
    uint32_t archive_offset = r.read_u32(offset);
    uint32_t seconds_per_point = r.read_u32(offset);
    uint32_t points = r.read_u32(offset);

    if (seconds_per_point == 0) {
      throw invalid_header(string_printf(
          "archive %" PRIu32 " has a precision of zero", x), descriptor_offset);
    }
    if (points == 0) {
      throw invalid_header(string_printf(
          "archive %" PRIu32 " contains no points", x), descriptor_offset);
    }

    ret.archives.emplace_back(x, archive_offset, seconds_per_point, points);
    if (ret.archives.back().retention() > max_retention) {
      max_retention = ret.archives.back().retention();
    }
  }
  ret.metadata.max_retention = max_retention;

  if (ret.metadata.declared_max_retention != max_retention) {
    ret.anomalies.emplace_back(AnomalyType::StaleMaxRetention, -1, 4, 1,
        string_printf("header declares max retention %" PRIu32
          " but archives cover %" PRIu64 " seconds",
          ret.metadata.declared_max_retention, max_retention));
  }

  float xff = ret.metadata.x_files_factor;
  if (isnan(xff) || (xff < 0) || (xff > 1)) {
    ret.anomalies.emplace_back(AnomalyType::InvalidXFilesFactor, -1, 8, 1,
        string_printf("x-files-factor %g is outside [0, 1]", xff));
  }

  return ret;
}
