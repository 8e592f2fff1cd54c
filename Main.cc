#include <inttypes.h>
#include <stdlib.h>
#include <string.h>

#include <memory>
#include <phosg/JSON.hh>
#include <phosg/Strings.hh>
#include <string>
#include <vector>

#include "Format/ByteReader.hh"
#include "Format/Errors.hh"
#include "Format/HeaderDecoder.hh"
#include "Format/WhisperFile.hh"
#include "Input/FileLoader.hh"
#include "Renderer/CSVRenderer.hh"
#include "Renderer/SummaryRenderer.hh"

using namespace std;


struct Options {
  vector<string> filenames;
  string config_filename;

  bool print_data;
  int64_t archive_index; // CSVRenderer::ALL_ARCHIVES unless --archive is given
  GapPolicy gap_policy;
  uint64_t now;
  size_t max_archive_count;
  int log_level;

  Options(int argc, char** argv) : print_data(false),
      archive_index(CSVRenderer::ALL_ARCHIVES),
      gap_policy(GapPolicy::Omit), now(0),
      max_archive_count(DEFAULT_MAX_ARCHIVE_COUNT), log_level(WARNING) {

    // the config file sets defaults; command-line options override them, so
    // find it before parsing anything else
    for (int x = 1; x < argc; x++) {
      if (!strncmp(argv[x], "--config=", 9)) {
        this->config_filename = &argv[x][9];
      }
    }
    if (!this->config_filename.empty()) {
      this->load_config(this->config_filename);
    }

    for (int x = 1; x < argc; x++) {
      if (!strncmp(argv[x], "--config=", 9)) {
        continue;
      } else if (!strcmp(argv[x], "--data")) {
        this->print_data = true;
      } else if (!strncmp(argv[x], "--archive=", 10)) {
        char* end;
        this->archive_index = strtoll(&argv[x][10], &end, 0);
        if ((argv[x][10] == 0) || *end || (this->archive_index < 0)) {
          throw invalid_argument(string_printf("invalid archive index: %s",
              &argv[x][10]));
        }
        this->print_data = true;
      } else if (!strncmp(argv[x], "--gaps=", 7)) {
        this->gap_policy = gap_policy_for_name(&argv[x][7]);
      } else if (!strncmp(argv[x], "--now=", 6)) {
        this->now = strtoull(&argv[x][6], NULL, 0);
      } else if (!strncmp(argv[x], "--log-level=", 12)) {
        this->log_level = strtol(&argv[x][12], NULL, 0);
      } else if (!strncmp(argv[x], "--", 2)) {
        throw invalid_argument(string_printf("unknown option: %s", argv[x]));
      } else {
        this->filenames.emplace_back(argv[x]);
      }
    }

    if (this->filenames.empty()) {
      throw invalid_argument("no files given");
    }
  }

  void load_config(const string& filename) {
    auto json = JSONObject::load(filename);

    try {
      this->log_level = (*json)["log_level"]->as_int();
    } catch (const JSONObject::key_error& e) { }
    try {
      this->max_archive_count = (*json)["max_archive_count"]->as_int();
    } catch (const JSONObject::key_error& e) { }
    try {
      this->gap_policy = gap_policy_for_name((*json)["gap_policy"]->as_string());
    } catch (const JSONObject::key_error& e) { }
    try {
      this->print_data = (*json)["print_data"]->as_bool();
    } catch (const JSONObject::key_error& e) { }
  }
};


void print_usage(const char* argv0) {
  fprintf(stderr, "\
Usage: %s [options] file.wsp [file.wsp ...]\n\
\n\
Prints the header and a summary of each archive in each whisper file. Files\n\
may be gzip-compressed.\n\
\n\
Options:\n\
  --config=FILE: read default options from this JSON file.\n\
  --data: print the points in every archive as CSV instead of a summary.\n\
  --archive=N: print only the points in archive N (implies --data). N must\n\
      not be negative.\n\
  --gaps=POLICY: how to print slots without a current value. %s (default)\n\
      skips them, %s prints them with a NaN value, and %s prints every\n\
      point ever written to the archive at its own timestamp.\n\
  --now=TIMESTAMP: treat this as the current time when checking for points\n\
      in the future.\n\
  --log-level=N: 0 = debug, 1 = info, 2 = warning (default), 3 = error.\n\
", argv0, name_for_gap_policy(GapPolicy::Omit),
      name_for_gap_policy(GapPolicy::NaN), name_for_gap_policy(GapPolicy::Written));
}

// returns false if the file couldn't be decoded
bool process_file(const Options& opt, const string& filename) {
  string data = load_whisper_data(filename);

  DecodeOptions decode_options;
  decode_options.now = opt.now;
  decode_options.max_archive_count = opt.max_archive_count;

  unique_ptr<Renderer> renderer;
  if (opt.print_data) {
    renderer.reset(new CSVRenderer(stdout, opt.gap_policy, opt.archive_index));
  } else {
    renderer.reset(new SummaryRenderer(stdout));
    fprintf(stdout, "\npath: %s\n\n", filename.c_str());
  }

  // the header can often be shown even when the archives can't be decoded
  ByteReader r(data);
  Header header = decode_header(r, opt.max_archive_count);
  renderer->render_header(header, data.size());

  DecodedFile file;
  try {
    file = decode_whisper_file(data, decode_options);
  } catch (const whisper_format_error& e) {
    log(ERROR, "%s can\'t be decoded: %s", filename.c_str(), e.what());
    return false;
  }

  for (const auto& anomaly : file.all_anomalies()) {
    log(WARNING, "%s: %s", filename.c_str(), anomaly.str().c_str());
  }
  renderer->render_file(file);
  return true;
}

int main(int argc, char** argv) {
  unique_ptr<Options> opt;
  try {
    opt.reset(new Options(argc, argv));
  } catch (const exception& e) {
    fprintf(stderr, "%s\n\n", e.what());
    print_usage(argv[0]);
    return 1;
  }
  set_log_level(opt->log_level);

  int retcode = 0;
  for (const auto& filename : opt->filenames) {
    try {
      if (!process_file(*opt, filename)) {
        retcode = 2;
      }
    } catch (const exception& e) {
      log(ERROR, "failed to read %s: %s", filename.c_str(), e.what());
      retcode = 2;
    }
  }
  return retcode;
}
