#include <stdio.h>
#include <time.h>

#include <phosg/UnitTest.hh>
#include <string>
#include <vector>

#include "ArchiveDecoder.hh"
#include "ByteReader.hh"
#include "Errors.hh"
#include "HeaderDecoder.hh"
#include "WhisperFile.hh"
#include "WhisperTestWriter.hh"

using namespace std;


static const uint64_t t0 = 1499997600;

static vector<WhisperTestWriter::ArchiveArg> small_layout() {
  return {{60, 120}, {300, 100}, {3600, 50}};
}

static Series make_series(uint64_t start_time, uint64_t step, size_t count) {
  Series ret;
  for (size_t x = 0; x < count; x++) {
    ret.emplace_back(start_time + x * step, x * 0.25 + 1.0);
  }
  return ret;
}

static DecodeOptions options_at(uint64_t now) {
  DecodeOptions options;
  options.now = now;
  return options;
}

template <typename ExcT>
static bool decode_raises(const string& data) {
  try {
    decode_whisper_file(data, options_at(t0 + 86400));
  } catch (const ExcT& e) {
    return true;
  }
  return false;
}


int main(int argc, char* argv[]) {

  {
    printf("-- round trip: every archive returns exactly what was written\n");
    WhisperTestWriter w(small_layout(), 0.5, 1);
    // archive 0 wraps around; the others don't
    Series data0 = make_series(t0, 60, 150);
    Series data1 = make_series(t0, 300, 40);
    Series data2 = make_series(t0, 3600, 50);
    w.write(0, data0);
    w.write(1, data1);
    w.write(2, data2);

    auto f = decode_whisper_file(w.data(), options_at(t0 + 86400 * 3));
    expect(!f.is_degraded());
    expect(f.metadata.aggregation_method.type() == AggregationType::Average);
    expect_eq(3, f.metadata.archive_count);
    expect_eq(180000, f.metadata.max_retention);
    expect_eq(3, f.archives.size());

    Series expected0(data0.end() - 120, data0.end());
    expect(expected0 == f.archives[0].points());
    expect(data1 == f.archives[1].points());
    expect(data2 == f.archives[2].points());
  }

  {
    printf("-- round trip with gaps: only the written points come back\n");
    WhisperTestWriter w(small_layout());
    Series data;
    for (const auto& pt : make_series(t0, 60, 100)) {
      if ((pt.timestamp / 60) % 7 != 3) {
        data.emplace_back(pt);
      }
    }
    w.write(0, data);
    auto f = decode_whisper_file(w.data(), options_at(t0 + 86400));
    expect(data == f.archives[0].points());
    expect(f.archives[1].empty());
    expect(f.archives[2].empty());
  }

  {
    printf("-- archives are in order of increasing precision and retention\n");
    WhisperTestWriter w(small_layout());
    w.write(0, make_series(t0, 60, 10));
    auto f = decode_whisper_file(w.data(), options_at(t0 + 86400));
    for (size_t x = 1; x < f.archives.size(); x++) {
      const auto& prev = f.archives[x - 1].metadata;
      const auto& curr = f.archives[x].metadata;
      expect_eq(x, curr.index);
      expect_lt(prev.seconds_per_point, curr.seconds_per_point);
      expect_le(prev.retention(), curr.retention());
    }
  }

  {
    printf("-- file that was never written decodes to empty archives\n");
    WhisperTestWriter w(small_layout());
    auto f = decode_whisper_file(w.data(), options_at(t0));
    expect(!f.is_degraded());
    expect_eq(3, f.archives.size());
    for (const auto& a : f.archives) {
      expect(a.empty());
    }
  }

  {
    printf("-- large file: archive metadata and max retention\n");
    WhisperTestWriter w({{10, 1555200}, {60, 5256000}, {3600, 87601}});
    expect_eq(82785664, w.data().size());
    w.write(2, make_series(t0, 3600, 24));

    auto f = decode_whisper_file(w.data(), options_at(t0 + 86400 * 2));
    expect(!f.is_degraded());
    expect_eq(3, f.archives.size());
    expect_eq(10, f.archives[0].metadata.seconds_per_point);
    expect_eq(1555200, f.archives[0].metadata.points);
    expect_eq(60, f.archives[1].metadata.seconds_per_point);
    expect_eq(5256000, f.archives[1].metadata.points);
    expect_eq(3600, f.archives[2].metadata.seconds_per_point);
    expect_eq(87601, f.archives[2].metadata.points);
    expect_eq(87601ULL * 3600, f.metadata.max_retention);

    expect(f.archives[0].empty());
    expect(f.archives[1].empty());
    expect(make_series(t0, 3600, 24) == f.archives[2].points());
  }

  {
    printf("-- buffer shorter than the descriptor table is truncated\n");
    WhisperTestWriter w(small_layout());
    expect(decode_raises<truncated_data>(w.data().substr(0, 0)));
    expect(decode_raises<truncated_data>(w.data().substr(0, 15)));
    expect(decode_raises<truncated_data>(w.data().substr(0, 51)));
  }

  {
    printf("-- truncation inside the last archive fails only that archive\n");
    WhisperTestWriter w(small_layout());
    w.write(0, make_series(t0, 60, 30));
    w.write(1, make_series(t0, 300, 20));
    w.write(2, make_series(t0, 3600, 10));
    uint64_t cut_size = w.archives()[2].offset + 5 * 12 + 7;
    w.truncate(cut_size);

    bool threw = false;
    try {
      decode_whisper_file(w.data(), options_at(t0 + 86400));
    } catch (const truncated_data& e) {
      expect_eq(w.archives()[2].offset, e.offset);
      expect_eq(w.archives()[2].end_offset(), e.expected_size);
      expect_eq(cut_size, e.actual_size);
      threw = true;
    }
    expect(threw);

    ByteReader r(w.data());
    Header h = decode_header(r);
    expect_eq(3, h.archives.size());
    auto a0 = decode_archive(r, h.archives[0], t0 + 86400);
    auto a1 = decode_archive(r, h.archives[1], t0 + 86400);
    expect(make_series(t0, 60, 30) == a0.points());
    expect(make_series(t0, 300, 20) == a1.points());

    threw = false;
    try {
      decode_archive(r, h.archives[2], t0 + 86400);
    } catch (const truncated_data& e) {
      threw = true;
    }
    expect(threw);
  }

  {
    printf("-- out-of-order precisions are a corrupt header\n");
    WhisperTestWriter w(small_layout());
    w.set_u32(16 + 12 + 4, 30); // archive 1: 30 seconds per point
    expect(decode_raises<corrupt_header>(w.data()));

    w.set_u32(16 + 12 + 4, 60); // same as archive 0
    expect(decode_raises<corrupt_header>(w.data()));
  }

  {
    printf("-- decreasing retention is a corrupt header\n");
    WhisperTestWriter w(small_layout());
    w.set_u32(16 + 24 + 8, 5); // archive 2: 3600 * 5 < 300 * 100
    expect(decode_raises<corrupt_header>(w.data()));
  }

  {
    printf("-- overlapping archives are a corrupt header\n");
    WhisperTestWriter w(small_layout());
    w.set_u32(16 + 12, w.archives()[0].offset + 12);
    expect(decode_raises<corrupt_header>(w.data()));
  }

  {
    printf("-- archive inside the file header is a corrupt header\n");
    WhisperTestWriter w(small_layout());
    w.set_u32(16, 20);
    expect(decode_raises<corrupt_header>(w.data()));
  }

  {
    printf("-- nonsensical archive count is an invalid header\n");
    WhisperTestWriter w(small_layout());
    w.set_u32(12, 0);
    expect(decode_raises<invalid_header>(w.data()));
    w.set_u32(12, 100000);
    expect(decode_raises<invalid_header>(w.data()));
  }

  {
    printf("-- advisory problems are returned with the decoded file\n");
    WhisperTestWriter w(small_layout(), 0.5, 99);
    w.write(0, make_series(t0, 60, 10));
    w.write_slot(0, 3, t0 + 3 * 60 + 1, 5.0);
    w.set_u32(4, 1);
    w.append(100);

    auto f = decode_whisper_file(w.data(), options_at(t0 + 86400));
    expect(f.is_degraded());
    expect_eq("unrecognized(99)", f.metadata.aggregation_method.name());

    expect_eq(2, f.anomalies.size());
    expect(f.anomalies[0].type == AnomalyType::StaleMaxRetention);
    expect(f.anomalies[1].type == AnomalyType::TrailingData);
    expect_eq(100, f.anomalies[1].count);

    expect_eq(1, f.archives[0].anomalies.size());
    expect(f.archives[0].anomalies[0].type == AnomalyType::CorruptArchive);
    expect_eq(9, f.archives[0].points().size());
    expect_eq(3, f.all_anomalies().size());
  }

  {
    printf("-- system clock is used when no current time is given\n");
    uint64_t test_now = time(NULL);
    WhisperTestWriter w(small_layout());
    w.write(0, make_series(test_now - 600, 60, 10));
    auto f = decode_whisper_file(w.data());
    expect(!f.is_degraded());
    expect_eq(10, f.archives[0].points().size());
  }

  {
    printf("-- decoding the same bytes twice gives identical results\n");
    WhisperTestWriter w(small_layout());
    w.write(0, make_series(t0, 60, 200));
    w.write(1, make_series(t0 + 900, 300, 30));
    w.write_slot(2, 7, t0 + 17, 3.0);
    auto a = decode_whisper_file(w.data(), options_at(t0 + 86400));
    auto b = decode_whisper_file(w.data(), options_at(t0 + 86400));
    expect(a == b);
  }

  printf("all tests passed\n");
  return 0;
}
