#pragma once

#include <stddef.h>

#include <vector>

#include "Types.hh"


// checks that the archive descriptors agree with each other: the descriptor
// count matches the header, archives start after the descriptor table, go
// from finest to coarsest resolution without losing retention, and don't
// overlap. throws corrupt_header on the first violation
void validate_archive_layout(const Header& header);

// throws truncated_data if the archive's points aren't all in the buffer
void validate_archive_bounds(const ArchiveMetadata& archive, size_t buffer_size);

// returns a TrailingData anomaly if the buffer extends past the last archive
std::vector<Anomaly> check_file_size(const Header& header, size_t buffer_size);
