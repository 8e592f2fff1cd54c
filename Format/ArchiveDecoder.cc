#include "ArchiveDecoder.hh"

#include <inttypes.h>
#include <math.h>

#include <vector>

#include <phosg/Strings.hh>

#include "Validation.hh"

using namespace std;


DecodedArchive decode_archive(const ByteReader& r,
    const ArchiveMetadata& archive, uint64_t now) {
  validate_archive_bounds(archive, r.size());

  DecodedArchive ret;
  ret.metadata = archive;

  // the timestamps are the working set; values are only read for slots that
  // were written. the anchor is the first slot with the largest timestamp
  uint64_t num_points = archive.points;
  vector<uint32_t> timestamps(num_points);
  uint64_t anchor_index = 0;
  uint32_t anchor_time = 0;
  for (uint64_t x = 0; x < num_points; x++) {
    size_t offset = archive.offset + x * POINT_SIZE;
    timestamps[x] = r.read_u32(offset);
    if (timestamps[x] > anchor_time) {
      anchor_time = timestamps[x];
      anchor_index = x;
    }
  }

  if (anchor_time == 0) {
    return ret; // never written
  }

  if (anchor_time > now + archive.seconds_per_point) {
    ret.anomalies.emplace_back(AnomalyType::FutureTimestamp, archive.index,
        archive.offset + anchor_index * POINT_SIZE, 1, string_printf(
          "most recent point has timestamp %" PRIu32 ", after current time %"
          PRIu64, anchor_time, now));
  }

  // position 0 is the slot after the anchor (the oldest); position
  // num_points - 1 is the anchor. nominal times at or before the epoch can't
  // hold real data, so those positions are never emitted
  int64_t step = archive.seconds_per_point;
  int64_t cycle = step * static_cast<int64_t>(num_points);
  uint64_t oldest_index = (anchor_index + 1) % num_points;

  uint64_t first_position = 0;
  for (; first_position < num_points; first_position++) {
    uint64_t index = (oldest_index + first_position) % num_points;
    int64_t nominal_time = static_cast<int64_t>(anchor_time) -
        static_cast<int64_t>(num_points - 1 - first_position) * step;
    if ((nominal_time > 0) && (timestamps[index] != 0)) {
      break;
    }
  }

  uint64_t misaligned_count = 0;
  uint64_t first_misaligned_offset = 0;
  int64_t first_misaligned_expected = 0;
  uint32_t first_misaligned_actual = 0;
  auto record_misaligned = [&](uint64_t index, int64_t expected_time) {
    if (misaligned_count == 0) {
      first_misaligned_offset = archive.offset + index * POINT_SIZE;
      first_misaligned_expected = expected_time;
      first_misaligned_actual = timestamps[index];
    }
    misaligned_count++;
  };

  // written slots skipped above are corrupt (they sit where the anchor says
  // no real time can be), but their data is still kept
  for (uint64_t position = 0; position < first_position; position++) {
    uint64_t index = (oldest_index + position) % num_points;
    if (timestamps[index] != 0) {
      record_misaligned(index, static_cast<int64_t>(anchor_time) -
          static_cast<int64_t>(num_points - 1 - position) * step);
      size_t value_offset = archive.offset + index * POINT_SIZE + sizeof(uint32_t);
      ret.unplaced_points.emplace_back(timestamps[index], r.read_f64(value_offset));
    }
  }

  ret.slots.reserve(num_points - first_position);
  for (uint64_t position = first_position; position < num_points; position++) {
    uint64_t index = (oldest_index + position) % num_points;
    int64_t nominal_time = static_cast<int64_t>(anchor_time) -
        static_cast<int64_t>(num_points - 1 - position) * step;
    uint32_t raw_time = timestamps[index];

    if (raw_time == 0) {
      ret.slots.emplace_back(nominal_time, 0, NAN, SlotState::Empty);
      continue;
    }

    size_t value_offset = archive.offset + index * POINT_SIZE + sizeof(uint32_t);
    double value = r.read_f64(value_offset);

    SlotState state;
    int64_t delta = nominal_time - static_cast<int64_t>(raw_time);
    if (delta == 0) {
      state = SlotState::Present;
    } else if ((delta > 0) && ((static_cast<int64_t>(anchor_time) - raw_time) % step == 0) &&
        (delta % cycle == 0)) {
      state = SlotState::Stale;
    } else {
      state = SlotState::Misaligned;
      record_misaligned(index, nominal_time);
    }
    ret.slots.emplace_back(nominal_time, raw_time, value, state);
  }

  if (misaligned_count) {
    ret.anomalies.emplace_back(AnomalyType::CorruptArchive, archive.index,
        first_misaligned_offset, misaligned_count, string_printf(
          "%" PRIu64 " points are not aligned to the archive\'s %" PRIu32
          "-second intervals; first at offset %" PRIu64 " (expected timestamp %"
          PRId64 ", found %" PRIu32 ")", misaligned_count,
          archive.seconds_per_point, first_misaligned_offset,
          first_misaligned_expected, first_misaligned_actual));
  }

  return ret;
}
