#ifndef EXECUTOR_HINTS_HPP
#define EXECUTOR_HINTS_HPP

#include <string>

#include "proto/codebox.pb.h"

namespace executor {

// Short guidance for the author of the code, picked by matching keywords of
// the error text. Deterministic.
std::string Hint(proto::ExecutionStatus status, const std::string& error_text,
                 proto::Language language);

}  // namespace executor

#endif
