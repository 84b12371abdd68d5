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

#include <memory>
#include <ostream>
#include <sstream>

#include <mdbx.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#if defined(__GNUC__) && !defined(__clang__) && __GNUC__ == 8
/* workaround to false-positive warnings about __cold */
#pragma GCC diagnostic ignored "-Wattributes"
#endif /* GCC 8.x */

static __cold const char *error2cp(int errcode) {
  static const char *const msgs[] = {
      "MKV_EOOPS: Internal unexpected Oops",
      "MKV_STATE_MISMATCH: Environment or transaction is in a state which "
      "forbids the operation",
      "MKV_INVALID_PATH: Path is a file where a directory is required (or "
      "vice versa), or the directory could not be created",
      "MKV_FOREIGN_HANDLE: Database handle belongs to another environment",
      "MKV_WANNA_DIE: Failure while transaction rollback (wanna die)"};

  static_assert(MKV_ARRAY_LENGTH(msgs) == MKV_ERROR_LAST - MKV_ERROR_BASE - 1,
                "WTF?");

  switch (errcode) {
  case MKV_SUCCESS:
    return "MKV_SUCCESS";
  default:
    if (errcode > MKV_ERROR_BASE && errcode < MKV_ERROR_LAST)
      return msgs[errcode - MKV_ERROR_BASE - 1];
  }
  return nullptr;
}

__cold const char *mkv_strerror(int errcode) {
  const char *msg = error2cp(errcode);
  return msg ? msg : mdbx_strerror(errcode);
}

__cold const char *mkv_strerror_r(int errcode, char *buf, size_t buflen) {
  const char *msg = error2cp(errcode);
  return msg ? msg : mdbx_strerror_r(errcode, buf, buflen);
}

namespace mkv {

__cold error_kind classify(int errcode) {
  switch (errcode) {
  case MKV_SUCCESS:
    return error_kind::success;
  case MKV_NOTFOUND:
    return error_kind::not_found;
  case MKV_KEYEXIST:
    return error_kind::key_exists;
  case MKV_TXN_FULL:
    return error_kind::txn_full;
  case MKV_CURSOR_FULL:
    return error_kind::cursor_full;
  case MKV_PAGE_FULL:
    return error_kind::page_full;
  case MKV_CORRUPTED:
  case MKV_PAGE_NOTFOUND:
    return error_kind::corrupted;
  case MKV_PANIC:
  case MKV_WANNA_RECOVERY:
  case MKV_WANNA_DIE:
    return error_kind::panic;
  case MKV_INVALID_PATH:
    return error_kind::invalid_path;
  case MKV_STATE_MISMATCH:
    return error_kind::state_error;
  default:
    return error_kind::custom;
  }
}

//------------------------------------------------------------------------------

static std::shared_ptr<spdlog::logger> mkv_make_logger() {
  std::shared_ptr<spdlog::logger> logger = spdlog::get("mkv");
  if (logger)
    return logger;

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  logger = std::make_shared<spdlog::logger>("mkv", sink);
  logger->set_level(spdlog::level::warn);
  spdlog::register_logger(logger);
  /* SPDLOG_LEVEL=mkv=debug and the like */
  spdlog::cfg::load_env_levels();
  return logger;
}

static spdlog::level::level_enum mkv_spdlog_level(mkv_log_level level) {
  switch (level) {
  case mkv_log_trace:
    return spdlog::level::trace;
  case mkv_log_debug:
    return spdlog::level::debug;
  case mkv_log_info:
    return spdlog::level::info;
  case mkv_log_warn:
    return spdlog::level::warn;
  case mkv_log_error:
    return spdlog::level::err;
  case mkv_log_critical:
    return spdlog::level::critical;
  default:
    return spdlog::level::off;
  }
}

void setup_debug(mkv_log_level level, bool trace_engine) {
  mkv_log().set_level(mkv_spdlog_level(level));
  mkv_engine_setup_debug(level, trace_engine);
}

} // namespace mkv

spdlog::logger &mkv_log() {
  static const std::shared_ptr<spdlog::logger> logger = mkv::mkv_make_logger();
  return *logger;
}

//------------------------------------------------------------------------------

namespace std {

static __cold ostream &invalid(ostream &out, const char *name,
                               const intptr_t value) {
  return out << "invalid(mkv::" << name << "=" << value << ")";
}

#define MKV_TOSTRING_IMP(type)                                                 \
  __cold string to_string(type value) {                                        \
    ostringstream out;                                                         \
    out << value;                                                              \
    return out.str();                                                          \
  }

__cold ostream &operator<<(ostream &out, const mkv_error value) {
  return out << mkv_strerror(value);
}
__cold string to_string(const mkv_error value) {
  return string(mkv_strerror(value));
}

__cold ostream &operator<<(ostream &out, const mkv_cursor_op value) {
  switch (value) {
  default:
    return invalid(out, "cursor_op", value);
  case mkv_first:
    return out << "first";
  case mkv_last:
    return out << "last";
  case mkv_get_current:
    return out << "current";
  case mkv_set_key:
    return out << "key.exact";
  case mkv_set_range:
    return out << "key.lower_bound";
  case mkv_get_both:
    return out << "item.exact";
  case mkv_next:
    return out << "next";
  case mkv_prev:
    return out << "prev";
  case mkv_next_nodup:
    return out << "key.next";
  case mkv_prev_nodup:
    return out << "key.prev";
  case mkv_next_dup:
    return out << "dup.next";
  case mkv_prev_dup:
    return out << "dup.prev";
  case mkv_first_dup:
    return out << "dup.first";
  case mkv_last_dup:
    return out << "dup.last";
  }
}
MKV_TOSTRING_IMP(const mkv_cursor_op)

__cold ostream &operator<<(ostream &out, const mkv::env_state value) {
  switch (value) {
  default:
    return invalid(out, "env_state", intptr_t(value));
  case mkv::env_state::created:
    return out << "created";
  case mkv::env_state::opened:
    return out << "opened";
  case mkv::env_state::closed:
    return out << "closed";
  }
}
MKV_TOSTRING_IMP(const mkv::env_state)

__cold ostream &operator<<(ostream &out, const mkv::txn_state value) {
  switch (value) {
  default:
    return invalid(out, "txn_state", intptr_t(value));
  case mkv::txn_state::normal:
    return out << "normal";
  case mkv::txn_state::released:
    return out << "released";
  case mkv::txn_state::invalid:
    return out << "invalid";
  }
}
MKV_TOSTRING_IMP(const mkv::txn_state)

__cold ostream &operator<<(ostream &out, const mkv::error_kind value) {
  switch (value) {
  default:
    return invalid(out, "error_kind", intptr_t(value));
  case mkv::error_kind::success:
    return out << "success";
  case mkv::error_kind::not_found:
    return out << "not_found";
  case mkv::error_kind::key_exists:
    return out << "key_exists";
  case mkv::error_kind::txn_full:
    return out << "txn_full";
  case mkv::error_kind::cursor_full:
    return out << "cursor_full";
  case mkv::error_kind::page_full:
    return out << "page_full";
  case mkv::error_kind::corrupted:
    return out << "corrupted";
  case mkv::error_kind::panic:
    return out << "panic";
  case mkv::error_kind::invalid_path:
    return out << "invalid_path";
  case mkv::error_kind::state_error:
    return out << "state_error";
  case mkv::error_kind::custom:
    return out << "custom";
  }
}
MKV_TOSTRING_IMP(const mkv::error_kind)

} // namespace std
