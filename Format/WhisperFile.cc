#include "WhisperFile.hh"

#include <utility>

#include <phosg/Time.hh>

#include "ArchiveDecoder.hh"
#include "ByteReader.hh"
#include "HeaderDecoder.hh"
#include "Validation.hh"

using namespace std;


DecodeOptions::DecodeOptions() : now(0),
    max_archive_count(DEFAULT_MAX_ARCHIVE_COUNT) { }


DecodedFile decode_whisper_file(const string& data,
    const DecodeOptions& options) {
  uint64_t t = options.now ? options.now : (now() / 1000000);

  ByteReader r(data);
  Header header = decode_header(r, options.max_archive_count);
  validate_archive_layout(header);

  DecodedFile ret;
  ret.metadata = header.metadata;
  ret.anomalies = move(header.anomalies);
  auto size_anomalies = check_file_size(header, r.size());
  ret.anomalies.insert(ret.anomalies.end(), size_anomalies.begin(),
      size_anomalies.end());

  ret.archives.reserve(header.archives.size());
  for (const auto& archive : header.archives) {
    ret.archives.emplace_back(decode_archive(r, archive, t));
  }
  return ret;
}
