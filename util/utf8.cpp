#include "util/utf8.hpp"

#include <algorithm>

namespace util {

namespace {
const constexpr char kReplacement[] = "\xEF\xBF\xBD";

// Length of the well-formed sequence at text[pos], 0 if it is ill-formed or
// -1 if text ends inside of it. *seen is the number of bytes that were
// accepted.
int Sequence(absl::string_view text, size_t pos, size_t* seen) {
  unsigned char lead = text[pos];
  *seen = 1;
  if (lead < 0x80) return 1;
  int len = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    if (lead == 0xE0) low = 0xA0;
    if (lead == 0xED) high = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    if (lead == 0xF0) low = 0x90;
    if (lead == 0xF4) high = 0x8F;
  } else {
    return 0;
  }
  for (int i = 1; i < len; i++) {
    if (pos + i >= text.size()) return -1;
    unsigned char c = text[pos + i];
    if (c < (i == 1 ? low : 0x80) || c > (i == 1 ? high : 0xBF)) return 0;
    *seen = i + 1;
  }
  return len;
}
}  // namespace

size_t Utf8Length(absl::string_view text) {
  return std::count_if(text.begin(), text.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  });
}

std::string ValidUtf8(absl::string_view text, bool truncated) {
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t seen = 0;
    int len = Sequence(text, pos, &seen);
    if (len > 0) {
      out.append(text.data() + pos, len);
      pos += len;
      continue;
    }
    if (len == -1 && truncated) break;
    out.append(kReplacement);
    pos += seen;
  }
  return out;
}

}  // namespace util
