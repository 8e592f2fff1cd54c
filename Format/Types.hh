#pragma once

#include <stdint.h>

#include <string>
#include <vector>


// sizes of the on-disk structures; all fields are big-endian
static const uint64_t FILE_HEADER_SIZE = 16;
static const uint64_t ARCHIVE_HEADER_SIZE = 12;
static const uint64_t POINT_SIZE = 12;


// codes match the reference whisper implementation
enum class AggregationType {
  Unrecognized = 0,
  Average = 1,
  Sum = 2,
  Last = 3,
  Max = 4,
  Min = 5,
  AverageZero = 6,
  AbsoluteMax = 7,
  AbsoluteMin = 8,
};

// the on-disk code is untrusted, so unknown codes are kept as Unrecognized
// along with the raw value instead of being cast into the enum
class AggregationMethod {
public:
  AggregationMethod();
  static AggregationMethod from_code(uint32_t code);

  AggregationType type() const;
  uint32_t code() const;
  bool is_recognized() const;
  std::string name() const;

  bool operator==(const AggregationMethod& other) const;
  bool operator!=(const AggregationMethod& other) const;

private:
  AggregationMethod(AggregationType type, uint32_t code);

  AggregationType agg_type;
  uint32_t raw_code;
};


struct ArchiveMetadata {
  uint32_t index;
  uint32_t offset;
  uint32_t seconds_per_point;
  uint32_t points;

  ArchiveMetadata();
  ArchiveMetadata(uint32_t index, uint32_t offset, uint32_t seconds_per_point,
      uint32_t points);

  uint64_t retention() const;
  uint64_t size() const;
  uint64_t end_offset() const;

  bool operator==(const ArchiveMetadata& other) const;
  bool operator!=(const ArchiveMetadata& other) const;
  std::string str() const;
};

struct FileMetadata {
  AggregationMethod aggregation_method;
  uint32_t declared_max_retention; // as stored in the file; may be stale
  uint64_t max_retention; // recomputed from the archives
  float x_files_factor;
  uint32_t archive_count;

  FileMetadata();

  bool operator==(const FileMetadata& other) const;
  bool operator!=(const FileMetadata& other) const;
};


enum class AnomalyType {
  CorruptArchive = 0,
  FutureTimestamp,
  StaleMaxRetention,
  InvalidXFilesFactor,
  TrailingData,
};

const char* name_for_anomaly_type(AnomalyType type);

// a problem that doesn't prevent decoding; returned alongside the result
struct Anomaly {
  AnomalyType type;
  int64_t archive_index; // -1 = file-level
  uint64_t offset;
  uint64_t count;
  std::string description;

  Anomaly(AnomalyType type, int64_t archive_index, uint64_t offset,
      uint64_t count, const std::string& description);

  bool operator==(const Anomaly& other) const;
  bool operator!=(const Anomaly& other) const;
  std::string str() const;
};


struct Header {
  FileMetadata metadata;
  std::vector<ArchiveMetadata> archives;
  std::vector<Anomaly> anomalies;

  uint64_t size() const;
  uint64_t expected_file_size() const;
};


struct Point {
  uint64_t timestamp;
  double value;

  Point();
  Point(uint64_t timestamp, double value);

  // compares values bitwise, so NaN gaps compare equal to themselves
  bool operator==(const Point& other) const;
  bool operator!=(const Point& other) const;
};

typedef std::vector<Point> Series;


enum class SlotState {
  Present = 0, // raw timestamp equals the nominal timestamp
  Empty, // never written
  Stale, // written during an earlier pass around the buffer
  Misaligned, // not where the anchor says it should be; corrupt
};

const char* name_for_slot_state(SlotState state);

struct Slot {
  uint64_t timestamp; // nominal timestamp of this position
  uint32_t raw_timestamp;
  double value; // NaN for Empty slots
  SlotState state;

  Slot(uint64_t timestamp, uint32_t raw_timestamp, double value, SlotState state);

  bool operator==(const Slot& other) const;
  bool operator!=(const Slot& other) const;
};


struct DecodedArchive {
  ArchiveMetadata metadata;

  // chronological; the last slot is the anchor (the most recent write).
  // positions before the first written slot are not included
  std::vector<Slot> slots;
  // written slots at positions whose nominal time would be at or before the
  // epoch, in buffer order. they're always counted as corrupt
  Series unplaced_points;
  std::vector<Anomaly> anomalies;

  bool empty() const;
  size_t present_count() const;
  bool is_degraded() const;

  // present points only
  Series points() const;
  // one point per slot; non-present slots get NaN at their nominal timestamp
  Series points_with_gaps() const;
  // every slot with a nonzero timestamp (unplaced ones included), at that
  // timestamp, sorted
  Series written_points() const;

  bool operator==(const DecodedArchive& other) const;
  bool operator!=(const DecodedArchive& other) const;
};


struct DecodedFile {
  FileMetadata metadata;
  std::vector<DecodedArchive> archives;
  std::vector<Anomaly> anomalies; // file-level only

  bool is_degraded() const;
  std::vector<Anomaly> all_anomalies() const;

  bool operator==(const DecodedFile& other) const;
  bool operator!=(const DecodedFile& other) const;
};


enum class GapPolicy {
  Omit = 0,
  NaN,
  Written,
};

GapPolicy gap_policy_for_name(const std::string& name);
const char* name_for_gap_policy(GapPolicy policy);

Series points_for_gap_policy(const DecodedArchive& archive, GapPolicy policy);
