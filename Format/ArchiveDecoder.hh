#pragma once

#include <stdint.h>

#include "ByteReader.hh"
#include "Types.hh"


// decodes one archive's circular buffer into chronological order.
//
// the slot holding the largest timestamp is the anchor (the most recent
// write); the slot after it is the oldest. every position's nominal timestamp
// follows from the anchor's timestamp and its distance from the anchor, so
// each slot is classified as present, empty, stale (left over from an earlier
// pass around the buffer) or misaligned. misaligned slots are reported as a
// CorruptArchive anomaly but don't stop decoding. an archive with no written
// slots decodes to no slots.
//
// now is used only to check that the anchor isn't in the future; it doesn't
// affect the decoded slots. throws truncated_data if the archive extends past
// the end of the buffer
DecodedArchive decode_archive(const ByteReader& r,
    const ArchiveMetadata& archive, uint64_t now);
