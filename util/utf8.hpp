#ifndef UTIL_UTF8_HPP
#define UTIL_UTF8_HPP

#include <cstddef>
#include <string>

#include "absl/strings/string_view.h"

namespace util {

// Number of code points of a UTF-8 string: the bytes that are not
// continuation bytes.
size_t Utf8Length(absl::string_view text);

// Returns text with every ill-formed sequence replaced by U+FFFD, so that it
// can be stored in a protobuf string field. If truncated is true, text was cut
// at an arbitrary byte and an incomplete sequence at its end is dropped.
std::string ValidUtf8(absl::string_view text, bool truncated = false);

}  // namespace util

#endif
