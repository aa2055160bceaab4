#ifndef POLICY_VALIDATOR_HPP
#define POLICY_VALIDATOR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "proto/codebox.pb.h"

namespace policy {

static const constexpr size_t kMaxCodeLength = 10000;
static const constexpr size_t kMaxStdinLength = 1000;

// A malformed request. Nothing has been allocated for it.
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& what)
      : std::invalid_argument(what) {}
};

class Validator {
 public:
  Validator(int32_t default_timeout_seconds, int32_t max_timeout_seconds)
      : default_timeout_seconds_(default_timeout_seconds),
        max_timeout_seconds_(max_timeout_seconds) {}

  // Throws ValidationError if the request cannot be executed.
  void Validate(const proto::ExecutionRequest& request) const;

  // Timeout the request runs with: the requested one, or the default if it is
  // absent or zero. The request must be valid.
  int32_t EffectiveTimeout(const proto::ExecutionRequest& request) const;

 private:
  int32_t default_timeout_seconds_;
  int32_t max_timeout_seconds_;
};

}  // namespace policy

#endif
