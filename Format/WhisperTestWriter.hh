#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "Types.hh"


// builds whisper files in memory for tests. points are placed the way whisper
// itself places them: relative to the timestamp in the archive's first slot
// (the base interval), modulo the archive size. nothing is propagated between
// archives
class WhisperTestWriter {
public:
  struct ArchiveArg {
    uint32_t seconds_per_point;
    uint32_t points;
  };

  WhisperTestWriter() = delete;
  WhisperTestWriter(const std::vector<ArchiveArg>& archive_args,
      float x_files_factor = 0.5, uint32_t aggregation_code = 1);
  WhisperTestWriter(const WhisperTestWriter& rhs) = delete;
  const WhisperTestWriter& operator=(const WhisperTestWriter& rhs) = delete;
  ~WhisperTestWriter() = default;

  const std::string& data() const;
  const std::vector<ArchiveMetadata>& archives() const;

  // timestamps are rounded down to the archive's interval
  void write(uint32_t archive_index, const Series& data);
  void write_slot(uint32_t archive_index, uint32_t slot, uint32_t timestamp,
      double value);

  void set_u32(size_t offset, uint32_t value);
  void set_f32(size_t offset, float value);
  void truncate(size_t size);
  void append(size_t size);

private:
  uint32_t get_base_interval(uint32_t archive_index) const;

  std::string contents;
  std::vector<ArchiveMetadata> archive_metadata;
};
