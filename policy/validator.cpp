#include "policy/validator.hpp"

#include <algorithm>
#include <cctype>

#include "absl/strings/str_cat.h"
#include "util/utf8.hpp"

namespace policy {

void Validator::Validate(const proto::ExecutionRequest& request) const {
  const std::string& code = request.code();
  if (std::all_of(code.begin(), code.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c));
      }))
    throw ValidationError("Code is required");
  if (util::Utf8Length(code) > kMaxCodeLength)
    throw ValidationError(absl::StrCat("Code must be at most ", kMaxCodeLength,
                                       " characters"));
  if (request.language() == proto::UNKNOWN_LANGUAGE ||
      !proto::Language_IsValid(request.language()))
    throw ValidationError("Language is required");
  if (util::Utf8Length(request.input()) > kMaxStdinLength)
    throw ValidationError(absl::StrCat("Input must be at most ",
                                       kMaxStdinLength, " characters"));
  if (request.has_timeout_seconds() && request.timeout_seconds() != 0 &&
      (request.timeout_seconds() < 1 ||
       request.timeout_seconds() > max_timeout_seconds_))
    throw ValidationError(absl::StrCat("Timeout must be between 1 and ",
                                       max_timeout_seconds_, " seconds"));
}

int32_t Validator::EffectiveTimeout(
    const proto::ExecutionRequest& request) const {
  if (request.timeout_seconds() == 0) return default_timeout_seconds_;
  return request.timeout_seconds();
}

}  // namespace policy
