#pragma once

namespace rangeserve::url {

// Decodes within the provided buffer, compacting percent-encoded sequences.
// '+' is kept as is: it only means space in query strings, never in paths.
// Returns nullptr on invalid encoding (truncated % or non-hex digits), leaving the buffer in an unspecified
// partially modified state (caller should discard it).
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodePathInPlace(char* first, const char* last);

}  // namespace rangeserve::url
