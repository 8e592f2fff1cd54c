#include "Renderer.hh"

#include <time.h>

using namespace std;


Renderer::Renderer(FILE* stream) : stream(stream) { }

string format_timestamp(uint64_t timestamp) {
  time_t t = timestamp;
  struct tm tm;
  gmtime_r(&t, &tm);

  char buffer[32];
  size_t size = strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
  return string(buffer, size);
}
