#include <stdio.h>

#include <phosg/UnitTest.hh>
#include <stdexcept>
#include <string>

#include "../Format/ByteReader.hh"
#include "../Format/HeaderDecoder.hh"
#include "../Format/WhisperFile.hh"
#include "../Format/WhisperTestWriter.hh"
#include "CSVRenderer.hh"
#include "SummaryRenderer.hh"

using namespace std;


static const uint64_t t0 = 1499997600;

// renders into a temporary file and returns what was written
template <typename FnT>
static string render_to_string(FnT fn) {
  FILE* f = tmpfile();
  if (!f) {
    throw runtime_error("can\'t create temporary file");
  }
  fn(f);
  fflush(f);
  rewind(f);

  string ret;
  char buffer[1024];
  size_t bytes_read;
  while ((bytes_read = fread(buffer, 1, sizeof(buffer), f)) > 0) {
    ret.append(buffer, bytes_read);
  }
  fclose(f);
  return ret;
}

static bool contains(const string& haystack, const string& needle) {
  return haystack.find(needle) != string::npos;
}


int main(int argc, char* argv[]) {

  WhisperTestWriter w({{60, 10}, {3600, 5}}, 0.5, 1);
  w.write(0, {Point(t0, 1.0), Point(t0 + 60, 2.5), Point(t0 + 180, 4.0)});
  DecodeOptions options;
  options.now = t0 + 86400;
  auto file = decode_whisper_file(w.data(), options);
  Header header = decode_header(ByteReader(w.data()));

  {
    printf("-- timestamps are formatted in UTC\n");
    expect_eq("2017-07-14 02:00:00", format_timestamp(t0));
    expect_eq("1970-01-01 00:00:00", format_timestamp(0));
  }

  {
    printf("-- summary of an intact file\n");
    string s = render_to_string([&](FILE* f) {
      SummaryRenderer r(f);
      r.render_header(header, w.data().size());
      r.render_file(file);
    });
    expect(!contains(s, "FILE IS CORRUPT"));
    expect(contains(s, "aggregation_method: average\n"));
    expect(contains(s, "max_retention: 18000\n"));
    expect(contains(s, "x_files_factor: 0.5\n"));
    expect(contains(s, "header_size: 40\n"));
    expect(contains(s, "Archive[index=0, offset=40, seconds_per_point=60, points=10, retention=600]\n"));
    expect(contains(s, "archive 0: 3 present, 1 empty, 0 stale, 0 misaligned from 2017-07-14 02:00:00 to 2017-07-14 02:03:00\n"));
    expect(contains(s, "archive 1: 0 present, 0 empty, 0 stale, 0 misaligned (never written)\n"));
    expect(!contains(s, "warning"));
  }

  {
    printf("-- summary of a truncated file says it\'s corrupt\n");
    string s = render_to_string([&](FILE* f) {
      SummaryRenderer r(f);
      r.render_header(header, 100);
    });
    expect(contains(s, "FILE IS CORRUPT!\n"));
    expect(contains(s, " actual size: 100\n"));
    expect(contains(s, " expected size: 220\n"));
  }

  {
    printf("-- csv with gaps omitted\n");
    string s = render_to_string([&](FILE* f) {
      CSVRenderer(f, GapPolicy::Omit).render_file(file);
    });
    expect_eq("archive,timestamp,value\n"
        "0,1499997600,1\n"
        "0,1499997660,2.5\n"
        "0,1499997780,4\n", s);
  }

  {
    printf("-- csv with gaps as nan, one archive only\n");
    string s = render_to_string([&](FILE* f) {
      CSVRenderer(f, GapPolicy::NaN, 0).render_file(file);
    });
    expect_eq("archive,timestamp,value\n"
        "0,1499997600,1\n"
        "0,1499997660,2.5\n"
        "0,1499997720,nan\n"
        "0,1499997780,4\n", s);
  }

  {
    printf("-- gap policies are parsed by name\n");
    for (GapPolicy policy : {GapPolicy::Omit, GapPolicy::NaN, GapPolicy::Written}) {
      expect(policy == gap_policy_for_name(name_for_gap_policy(policy)));
    }
    expect_eq("written", string(name_for_gap_policy(GapPolicy::Written)));

    bool threw = false;
    try {
      gap_policy_for_name("zero");
    } catch (const invalid_argument& e) {
      threw = true;
    }
    expect(threw);
  }

  {
    printf("-- csv with written points includes stale slots at their own time\n");
    WhisperTestWriter w2({{60, 10}});
    w2.write(0, {Point(t0, 1.0), Point(t0 + 60, 2.5)});
    // one full cycle older than the position it occupies
    w2.write_slot(0, 2, t0 - 1080, 7.0);
    auto stale_file = decode_whisper_file(w2.data(), options);
    expect_eq(1, stale_file.archives.size());
    expect(stale_file.archives[0].slots.front().state == SlotState::Stale);

    string s = render_to_string([&](FILE* f) {
      CSVRenderer(f, GapPolicy::Written).render_file(stale_file);
    });
    expect_eq("archive,timestamp,value\n"
        "0,1499996520,7\n"
        "0,1499997600,1\n"
        "0,1499997660,2.5\n", s);

    s = render_to_string([&](FILE* f) {
      CSVRenderer(f, GapPolicy::Omit).render_file(stale_file);
    });
    expect_eq("archive,timestamp,value\n"
        "0,1499997600,1\n"
        "0,1499997660,2.5\n", s);

    s = render_to_string([&](FILE* f) {
      SummaryRenderer(f).render_file(stale_file);
    });
    expect(contains(s, "archive 0: 2 present, 7 empty, 1 stale, 0 misaligned from 2017-07-14 01:52:00 to 2017-07-14 02:01:00\n"));
  }

  {
    printf("-- csv renderer rejects negative archive indexes\n");
    bool threw = false;
    try {
      CSVRenderer r(stdout, GapPolicy::Omit, -2);
    } catch (const invalid_argument& e) {
      threw = true;
    }
    expect(threw);
  }

  {
    printf("-- csv for a nonexistent archive fails\n");
    bool threw = false;
    try {
      render_to_string([&](FILE* f) {
        CSVRenderer(f, GapPolicy::Omit, 2).render_file(file);
      });
    } catch (const out_of_range& e) {
      threw = true;
    }
    expect(threw);
  }

  printf("all tests passed\n");
  return 0;
}
