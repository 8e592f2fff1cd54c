#include "WhisperTestWriter.hh"

#include <string.h>

#include <stdexcept>

#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>

using namespace std;


WhisperTestWriter::WhisperTestWriter(const vector<ArchiveArg>& archive_args,
    float x_files_factor, uint32_t aggregation_code) {
  if (archive_args.empty()) {
    throw invalid_argument("no archives present");
  }

  uint64_t offset = FILE_HEADER_SIZE + archive_args.size() * ARCHIVE_HEADER_SIZE;
  uint64_t max_retention = 0;
  for (size_t x = 0; x < archive_args.size(); x++) {
    this->archive_metadata.emplace_back(x, offset,
        archive_args[x].seconds_per_point, archive_args[x].points);
    offset += this->archive_metadata.back().size();
    if (this->archive_metadata.back().retention() > max_retention) {
      max_retention = this->archive_metadata.back().retention();
    }
  }
  this->contents.resize(offset, '\0');

  this->set_u32(0, aggregation_code);
  this->set_u32(4, max_retention);
  this->set_f32(8, x_files_factor);
  this->set_u32(12, this->archive_metadata.size());
  size_t header_offset = FILE_HEADER_SIZE;
  for (const auto& archive : this->archive_metadata) {
    this->set_u32(header_offset, archive.offset);
    this->set_u32(header_offset + 4, archive.seconds_per_point);
    this->set_u32(header_offset + 8, archive.points);
    header_offset += ARCHIVE_HEADER_SIZE;
  }
}

const string& WhisperTestWriter::data() const {
  return this->contents;
}

const vector<ArchiveMetadata>& WhisperTestWriter::archives() const {
  return this->archive_metadata;
}

void WhisperTestWriter::write(uint32_t archive_index, const Series& data) {
  const auto& archive = this->archive_metadata.at(archive_index);

  for (const auto& pt : data) {
    // if the archive is blank, the first point written goes in the first slot
    int64_t base_interval = this->get_base_interval(archive_index);
    int64_t point_interval = pt.timestamp - (pt.timestamp % archive.seconds_per_point);
    if (base_interval == 0) {
      base_interval = point_interval;
    }

    int64_t point_distance = (point_interval - base_interval) / archive.seconds_per_point;
    point_distance %= static_cast<int64_t>(archive.points);
    if (point_distance < 0) {
      point_distance += archive.points;
    }
    this->write_slot(archive_index, point_distance, point_interval, pt.value);
  }
}

void WhisperTestWriter::write_slot(uint32_t archive_index, uint32_t slot,
    uint32_t timestamp, double value) {
  const auto& archive = this->archive_metadata.at(archive_index);
  if (slot >= archive.points) {
    throw out_of_range(string_printf("slot %u is beyond the end of archive %u",
        slot, archive_index));
  }

  size_t offset = archive.offset + slot * POINT_SIZE;
  this->set_u32(offset, timestamp);
  uint64_t sw_value = bswap64f(value);
  memcpy(&this->contents[offset + 4], &sw_value, sizeof(sw_value));
}

void WhisperTestWriter::set_u32(size_t offset, uint32_t value) {
  uint32_t sw_value = bswap32(value);
  memcpy(&this->contents.at(offset), &sw_value, sizeof(sw_value));
}

void WhisperTestWriter::set_f32(size_t offset, float value) {
  uint32_t sw_value = bswap32f(value);
  memcpy(&this->contents.at(offset), &sw_value, sizeof(sw_value));
}

void WhisperTestWriter::truncate(size_t size) {
  this->contents.resize(size);
}

void WhisperTestWriter::append(size_t size) {
  this->contents.resize(this->contents.size() + size, '\0');
}

uint32_t WhisperTestWriter::get_base_interval(uint32_t archive_index) const {
  const auto& archive = this->archive_metadata.at(archive_index);
  uint32_t sw_time;
  memcpy(&sw_time, &this->contents.at(archive.offset), sizeof(sw_time));
  return bswap32(sw_time);
}
