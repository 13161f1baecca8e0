// Copyright 2026 The Codesmell Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef CODESMELL_COMMON_UTIL_STATUS_MACROS_H_
#define CODESMELL_COMMON_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"

// Run a command that returns an absl::Status.  If the called code returns an
// error status, return that status up out of this method too.
//
// Example:
//   RETURN_IF_ERROR(store->Save(fingerprints));
#define RETURN_IF_ERROR(expr)                                                \
  do {                                                                       \
    /* Using _status below to avoid capture problems if expr is "status". */ \
    absl::Status _status = (expr);                                           \
    if (ABSL_PREDICT_FALSE(!_status.ok())) return _status;                   \
  } while (0)

// Assigns the value of an absl::StatusOr<T> expression to 'lhs', or returns
// its error status from the current function.
//
// Example:
//   ASSIGN_OR_RETURN(std::string content, file::GetContentAsString(path));
#define CODESMELL_STATUS_CONCAT_INNER_(x, y) x##y
#define CODESMELL_STATUS_CONCAT_(x, y) CODESMELL_STATUS_CONCAT_INNER_(x, y)
#define ASSIGN_OR_RETURN(lhs, expr)                                          \
  ASSIGN_OR_RETURN_IMPL_(CODESMELL_STATUS_CONCAT_(_status_or_, __LINE__), \
                         lhs, expr)
#define ASSIGN_OR_RETURN_IMPL_(statusor, lhs, expr)    \
  auto statusor = (expr);                              \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {            \
    return statusor.status();                          \
  }                                                    \
  lhs = std::move(statusor).value()

#endif  // CODESMELL_COMMON_UTIL_STATUS_MACROS_H_
