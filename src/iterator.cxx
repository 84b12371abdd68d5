/*
 *  Memory-mapped Key-Value (libmkv).
 *  Copyright 2016-2020 Leonid Yuriev <leo@yuriev.ru>
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 */

#include "details.h"

using namespace mkv;

/* Bounds are copied into the policy, so a range stays usable after the
 * caller's key objects are gone. */
static __inline std::string mkv_bound(const slice &key) {
  return std::string(key.char_ptr(), key.size());
}

template <class Policy>
static result<cursor_range<Policy>> mkv_make_range(const database &db,
                                                   Policy policy) {
  result<cursor> source = db.new_cursor();
  if (unlikely(!source.ok()))
    return result<cursor_range<Policy>>(source.err);
  return result<cursor_range<Policy>>(
      MKV_SUCCESS,
      cursor_range<Policy>(std::move(source.value), std::move(policy)));
}

result<cursor_range<scan_all>> database::iter() const {
  return mkv_make_range(*this, scan_all());
}

result<cursor_range<scan_from>> database::range_from(const slice &start) const {
  scan_from policy;
  policy.start = mkv_bound(start);
  return mkv_make_range(*this, std::move(policy));
}

result<cursor_range<scan_to>> database::range_to(const slice &end) const {
  scan_to policy;
  policy.end = mkv_bound(end);
  return mkv_make_range(*this, std::move(policy));
}

result<cursor_range<scan_range>>
database::range_between(const slice &start, const slice &end,
                        bool end_inclusive) const {
  scan_range policy;
  policy.start = mkv_bound(start);
  policy.end = mkv_bound(end);
  policy.end_inclusive = end_inclusive;
  return mkv_make_range(*this, std::move(policy));
}

result<cursor_range<scan_items>> database::range_items(const slice &key) const {
  scan_items policy;
  policy.key = mkv_bound(key);
  return mkv_make_range(*this, std::move(policy));
}
