#pragma once

#include <string>


bool is_gzip_data(const std::string& data);
// decompresses every gzip member in data; throws runtime_error on truncated
// or trailing data
std::string gunzip_data(const std::string& data);

// reads an entire whisper file, decompressing it if it's gzip-wrapped
std::string load_whisper_data(const std::string& filename);
