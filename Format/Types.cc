#include "Types.hh"

#include <inttypes.h>
#include <math.h>
#include <string.h>

#include <algorithm>
#include <stdexcept>

#include <phosg/Strings.hh>

using namespace std;


AggregationMethod::AggregationMethod()
    : agg_type(AggregationType::Unrecognized), raw_code(0) { }

AggregationMethod::AggregationMethod(AggregationType type, uint32_t code)
    : agg_type(type), raw_code(code) { }

AggregationMethod AggregationMethod::from_code(uint32_t code) {
  switch (code) {
    case 1:
      return AggregationMethod(AggregationType::Average, code);
    case 2:
      return AggregationMethod(AggregationType::Sum, code);
    case 3:
      return AggregationMethod(AggregationType::Last, code);
    case 4:
      return AggregationMethod(AggregationType::Max, code);
    case 5:
      return AggregationMethod(AggregationType::Min, code);
    case 6:
      return AggregationMethod(AggregationType::AverageZero, code);
    case 7:
      return AggregationMethod(AggregationType::AbsoluteMax, code);
    case 8:
      return AggregationMethod(AggregationType::AbsoluteMin, code);
    default:
      return AggregationMethod(AggregationType::Unrecognized, code);
  }
}

AggregationType AggregationMethod::type() const {
  return this->agg_type;
}

uint32_t AggregationMethod::code() const {
  return this->raw_code;
}

bool AggregationMethod::is_recognized() const {
  return this->agg_type != AggregationType::Unrecognized;
}

string AggregationMethod::name() const {
  switch (this->agg_type) {
    case AggregationType::Average:
      return "average";
    case AggregationType::Sum:
      return "sum";
    case AggregationType::Last:
      return "last";
    case AggregationType::Max:
      return "max";
    case AggregationType::Min:
      return "min";
    case AggregationType::AverageZero:
      return "avg_zero";
    case AggregationType::AbsoluteMax:
      return "absmax";
    case AggregationType::AbsoluteMin:
      return "absmin";
    case AggregationType::Unrecognized:
      break;
  }
  return string_printf("unrecognized(%" PRIu32 ")", this->raw_code);
}

bool AggregationMethod::operator==(const AggregationMethod& other) const {
  return (this->agg_type == other.agg_type) && (this->raw_code == other.raw_code);
}

bool AggregationMethod::operator!=(const AggregationMethod& other) const {
  return !this->operator==(other);
}


ArchiveMetadata::ArchiveMetadata() : index(0), offset(0), seconds_per_point(0),
    points(0) { }

ArchiveMetadata::ArchiveMetadata(uint32_t index, uint32_t offset,
    uint32_t seconds_per_point, uint32_t points) : index(index), offset(offset),
    seconds_per_point(seconds_per_point), points(points) { }

uint64_t ArchiveMetadata::retention() const {
  return static_cast<uint64_t>(this->seconds_per_point) * this->points;
}

uint64_t ArchiveMetadata::size() const {
  return static_cast<uint64_t>(this->points) * POINT_SIZE;
}

uint64_t ArchiveMetadata::end_offset() const {
  return this->offset + this->size();
}

bool ArchiveMetadata::operator==(const ArchiveMetadata& other) const {
  return (this->index == other.index) &&
         (this->offset == other.offset) &&
         (this->seconds_per_point == other.seconds_per_point) &&
         (this->points == other.points);
}

bool ArchiveMetadata::operator!=(const ArchiveMetadata& other) const {
  return !this->operator==(other);
}

string ArchiveMetadata::str() const {
  return string_printf("Archive[index=%" PRIu32 ", offset=%" PRIu32
      ", seconds_per_point=%" PRIu32 ", points=%" PRIu32 "]", this->index,
      this->offset, this->seconds_per_point, this->points);
}


FileMetadata::FileMetadata() : declared_max_retention(0), max_retention(0),
    x_files_factor(0), archive_count(0) { }

bool FileMetadata::operator==(const FileMetadata& other) const {
  return (this->aggregation_method == other.aggregation_method) &&
         (this->declared_max_retention == other.declared_max_retention) &&
         (this->max_retention == other.max_retention) &&
         !memcmp(&this->x_files_factor, &other.x_files_factor, sizeof(float)) &&
         (this->archive_count == other.archive_count);
}

bool FileMetadata::operator!=(const FileMetadata& other) const {
  return !this->operator==(other);
}


const char* name_for_anomaly_type(AnomalyType type) {
  switch (type) {
    case AnomalyType::CorruptArchive:
      return "CorruptArchive";
    case AnomalyType::FutureTimestamp:
      return "FutureTimestamp";
    case AnomalyType::StaleMaxRetention:
      return "StaleMaxRetention";
    case AnomalyType::InvalidXFilesFactor:
      return "InvalidXFilesFactor";
    case AnomalyType::TrailingData:
      return "TrailingData";
  }
  return "Unknown";
}

Anomaly::Anomaly(AnomalyType type, int64_t archive_index, uint64_t offset,
    uint64_t count, const string& description) : type(type),
    archive_index(archive_index), offset(offset), count(count),
    description(description) { }

bool Anomaly::operator==(const Anomaly& other) const {
  return (this->type == other.type) &&
         (this->archive_index == other.archive_index) &&
         (this->offset == other.offset) &&
         (this->count == other.count) &&
         (this->description == other.description);
}

bool Anomaly::operator!=(const Anomaly& other) const {
  return !this->operator==(other);
}

string Anomaly::str() const {
  if (this->archive_index < 0) {
    return string_printf("%s: %s", name_for_anomaly_type(this->type),
        this->description.c_str());
  }
  return string_printf("%s in archive %" PRId64 ": %s",
      name_for_anomaly_type(this->type), this->archive_index,
      this->description.c_str());
}


uint64_t Header::size() const {
  return FILE_HEADER_SIZE + ARCHIVE_HEADER_SIZE * this->archives.size();
}

uint64_t Header::expected_file_size() const {
  uint64_t size = this->size();
  for (const auto& archive : this->archives) {
    size += archive.size();
  }
  return size;
}


Point::Point() : timestamp(0), value(0) { }

Point::Point(uint64_t timestamp, double value) : timestamp(timestamp),
    value(value) { }

bool Point::operator==(const Point& other) const {
  return (this->timestamp == other.timestamp) &&
         !memcmp(&this->value, &other.value, sizeof(double));
}

bool Point::operator!=(const Point& other) const {
  return !this->operator==(other);
}


const char* name_for_slot_state(SlotState state) {
  switch (state) {
    case SlotState::Present:
      return "present";
    case SlotState::Empty:
      return "empty";
    case SlotState::Stale:
      return "stale";
    case SlotState::Misaligned:
      return "misaligned";
  }
  return "unknown";
}

Slot::Slot(uint64_t timestamp, uint32_t raw_timestamp, double value,
    SlotState state) : timestamp(timestamp), raw_timestamp(raw_timestamp),
    value(value), state(state) { }

bool Slot::operator==(const Slot& other) const {
  return (this->timestamp == other.timestamp) &&
         (this->raw_timestamp == other.raw_timestamp) &&
         !memcmp(&this->value, &other.value, sizeof(double)) &&
         (this->state == other.state);
}

bool Slot::operator!=(const Slot& other) const {
  return !this->operator==(other);
}


bool DecodedArchive::empty() const {
  return this->slots.empty();
}

size_t DecodedArchive::present_count() const {
  size_t count = 0;
  for (const auto& slot : this->slots) {
    if (slot.state == SlotState::Present) {
      count++;
    }
  }
  return count;
}

bool DecodedArchive::is_degraded() const {
  return !this->anomalies.empty();
}

Series DecodedArchive::points() const {
  Series ret;
  ret.reserve(this->slots.size());
  for (const auto& slot : this->slots) {
    if (slot.state == SlotState::Present) {
      ret.emplace_back(slot.timestamp, slot.value);
    }
  }
  return ret;
}

Series DecodedArchive::points_with_gaps() const {
  Series ret;
  ret.reserve(this->slots.size());
  for (const auto& slot : this->slots) {
    if (slot.state == SlotState::Present) {
      ret.emplace_back(slot.timestamp, slot.value);
    } else {
      ret.emplace_back(slot.timestamp, NAN);
    }
  }
  return ret;
}

Series DecodedArchive::written_points() const {
  Series ret = this->unplaced_points;
  ret.reserve(ret.size() + this->slots.size());
  for (const auto& slot : this->slots) {
    if (slot.state != SlotState::Empty) {
      ret.emplace_back(slot.raw_timestamp, slot.value);
    }
  }
  stable_sort(ret.begin(), ret.end(), [](const Point& a, const Point& b) {
    return a.timestamp < b.timestamp;
  });
  return ret;
}

bool DecodedArchive::operator==(const DecodedArchive& other) const {
  return (this->metadata == other.metadata) &&
         (this->slots == other.slots) &&
         (this->unplaced_points == other.unplaced_points) &&
         (this->anomalies == other.anomalies);
}

bool DecodedArchive::operator!=(const DecodedArchive& other) const {
  return !this->operator==(other);
}


bool DecodedFile::is_degraded() const {
  if (!this->anomalies.empty()) {
    return true;
  }
  for (const auto& archive : this->archives) {
    if (archive.is_degraded()) {
      return true;
    }
  }
  return false;
}

vector<Anomaly> DecodedFile::all_anomalies() const {
  vector<Anomaly> ret = this->anomalies;
  for (const auto& archive : this->archives) {
    ret.insert(ret.end(), archive.anomalies.begin(), archive.anomalies.end());
  }
  return ret;
}

bool DecodedFile::operator==(const DecodedFile& other) const {
  return (this->metadata == other.metadata) &&
         (this->archives == other.archives) &&
         (this->anomalies == other.anomalies);
}

bool DecodedFile::operator!=(const DecodedFile& other) const {
  return !this->operator==(other);
}


GapPolicy gap_policy_for_name(const string& name) {
  if (name == "omit") {
    return GapPolicy::Omit;
  }
  if (name == "nan") {
    return GapPolicy::NaN;
  }
  if (name == "written") {
    return GapPolicy::Written;
  }
  throw invalid_argument("unknown gap policy: " + name);
}

const char* name_for_gap_policy(GapPolicy policy) {
  switch (policy) {
    case GapPolicy::Omit:
      return "omit";
    case GapPolicy::NaN:
      return "nan";
    case GapPolicy::Written:
      return "written";
  }
  return "unknown";
}

Series points_for_gap_policy(const DecodedArchive& archive, GapPolicy policy) {
  switch (policy) {
    case GapPolicy::Omit:
      return archive.points();
    case GapPolicy::NaN:
      return archive.points_with_gaps();
    case GapPolicy::Written:
      return archive.written_points();
  }
  throw logic_error("unhandled gap policy");
}
