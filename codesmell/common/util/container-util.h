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

// -*- c++ -*-
#ifndef CODESMELL_COMMON_UTIL_CONTAINER_UTIL_H_
#define CODESMELL_COMMON_UTIL_CONTAINER_UTIL_H_

namespace codesmell {
namespace container {

// Returns a pointer to the value mapped to 'k', or nullptr if absent.
// Works with maps that support heterogeneous lookup, so 'k' may be any type
// comparable with the key type.
template <class M, class K>
const typename M::mapped_type *FindOrNull(const M &map, const K &k) {
  auto found = map.find(k);
  return (found == map.end()) ? nullptr : &found->second;
}

// Returns the value mapped to 'key', or 'd' if absent.
template <class M, class K>
const typename M::mapped_type &FindWithDefault(
    const M &map, const K &key, const typename M::mapped_type &d) {
  auto found = map.find(key);
  return (found == map.end()) ? d : found->second;
}

}  // namespace container
}  // namespace codesmell

#endif  // CODESMELL_COMMON_UTIL_CONTAINER_UTIL_H_
