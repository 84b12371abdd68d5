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

#include <stdarg.h>
#include <stdio.h>

#include <new>

#include <mdbx.h>

static_assert(int(MKV_KEYEXIST) == int(MDBX_KEYEXIST), "mismatch");
static_assert(int(MKV_NOTFOUND) == int(MDBX_NOTFOUND), "mismatch");
static_assert(int(MKV_PAGE_NOTFOUND) == int(MDBX_PAGE_NOTFOUND), "mismatch");
static_assert(int(MKV_CORRUPTED) == int(MDBX_CORRUPTED), "mismatch");
static_assert(int(MKV_PANIC) == int(MDBX_PANIC), "mismatch");
static_assert(int(MKV_VERSION_MISMATCH) == int(MDBX_VERSION_MISMATCH),
              "mismatch");
static_assert(int(MKV_INVALID) == int(MDBX_INVALID), "mismatch");
static_assert(int(MKV_MAP_FULL) == int(MDBX_MAP_FULL), "mismatch");
static_assert(int(MKV_DBS_FULL) == int(MDBX_DBS_FULL), "mismatch");
static_assert(int(MKV_READERS_FULL) == int(MDBX_READERS_FULL), "mismatch");
static_assert(int(MKV_TXN_FULL) == int(MDBX_TXN_FULL), "mismatch");
static_assert(int(MKV_CURSOR_FULL) == int(MDBX_CURSOR_FULL), "mismatch");
static_assert(int(MKV_PAGE_FULL) == int(MDBX_PAGE_FULL), "mismatch");
static_assert(int(MKV_UNABLE_EXTEND_MAPSIZE) ==
                  int(MDBX_UNABLE_EXTEND_MAPSIZE),
              "mismatch");
static_assert(int(MKV_INCOMPATIBLE) == int(MDBX_INCOMPATIBLE), "mismatch");
static_assert(int(MKV_BAD_RSLOT) == int(MDBX_BAD_RSLOT), "mismatch");
static_assert(int(MKV_BAD_TXN) == int(MDBX_BAD_TXN), "mismatch");
static_assert(int(MKV_BAD_VALSIZE) == int(MDBX_BAD_VALSIZE), "mismatch");
static_assert(int(MKV_BAD_DBI) == int(MDBX_BAD_DBI), "mismatch");
static_assert(int(MKV_PROBLEM) == int(MDBX_PROBLEM), "mismatch");
static_assert(int(MKV_BUSY) == int(MDBX_BUSY), "mismatch");
static_assert(int(MKV_EMULTIVAL) == int(MDBX_EMULTIVAL), "mismatch");
static_assert(int(MKV_EBADSIGN) == int(MDBX_EBADSIGN), "mismatch");
static_assert(int(MKV_WANNA_RECOVERY) == int(MDBX_WANNA_RECOVERY), "mismatch");
static_assert(int(MKV_EKEYMISMATCH) == int(MDBX_EKEYMISMATCH), "mismatch");
static_assert(int(MKV_TOO_LARGE) == int(MDBX_TOO_LARGE), "mismatch");
static_assert(int(MKV_THREAD_MISMATCH) == int(MDBX_THREAD_MISMATCH),
              "mismatch");

using namespace mkv;

engine::~engine() {}

//----------------------------------------------------------------------------
/* Translation of flags and operations */

struct mkv_flag_pair {
  unsigned mkv, mdbx;
};

static const mkv_flag_pair env_flags_map[] = {
    {mkv_nosubdir, MDBX_NOSUBDIR},
    {mkv_readonly, MDBX_RDONLY},
    {mkv_exclusive, MDBX_EXCLUSIVE},
    {mkv_accede, MDBX_ACCEDE},
    {mkv_writemap, MDBX_WRITEMAP},
    {mkv_notls, MDBX_NOTLS},
    {mkv_nordahead, MDBX_NORDAHEAD},
    {mkv_nomeminit, MDBX_NOMEMINIT},
    {mkv_coalesce, MDBX_COALESCE},
    {mkv_liforeclaim, MDBX_LIFORECLAIM},
    {mkv_nometasync, MDBX_NOMETASYNC},
    {mkv_safe_nosync, MDBX_SAFE_NOSYNC},
    {mkv_utterly_nosync, MDBX_UTTERLY_NOSYNC}};

static const mkv_flag_pair db_flags_map[] = {
    {mkv_reversekey, MDBX_REVERSEKEY},
    {mkv_dupsort, MDBX_DUPSORT},
    {mkv_integerkey, MDBX_INTEGERKEY},
    {mkv_dupfixed, MDBX_DUPFIXED},
    {mkv_integerdup, MDBX_INTEGERDUP},
    {mkv_reversedup, MDBX_REVERSEDUP},
    {mkv_create, MDBX_CREATE}};

static const mkv_flag_pair put_flags_map[] = {
    {mkv_nooverwrite, MDBX_NOOVERWRITE},
    {mkv_nodupdata, MDBX_NODUPDATA},
    {mkv_current, MDBX_CURRENT},
    {mkv_alldups, MDBX_NODUPDATA},
    {mkv_append, MDBX_APPEND},
    {mkv_appenddup, MDBX_APPENDDUP}};

template <size_t N>
static unsigned to_mdbx(const mkv_flag_pair (&map)[N], unsigned flags) {
  unsigned result = 0;
  for (size_t i = 0; i < N; ++i)
    if (flags & map[i].mkv)
      result |= map[i].mdbx;
  return result;
}

/* MDBX_UTTERLY_NOSYNC includes MDBX_SAFE_NOSYNC, so composite engine bits
 * must match as a whole. */
template <size_t N>
static unsigned from_mdbx(const mkv_flag_pair (&map)[N], unsigned flags) {
  unsigned result = 0;
  for (size_t i = 0; i < N; ++i)
    if ((flags & map[i].mdbx) == map[i].mdbx)
      result |= map[i].mkv;
  return result;
}

static MDBX_cursor_op to_mdbx(mkv_cursor_op op) {
  switch (op) {
  case mkv_first:
    return MDBX_FIRST;
  case mkv_last:
    return MDBX_LAST;
  case mkv_get_current:
    return MDBX_GET_CURRENT;
  case mkv_set_key:
    return MDBX_SET_KEY;
  case mkv_set_range:
    return MDBX_SET_RANGE;
  case mkv_get_both:
    return MDBX_GET_BOTH;
  case mkv_next:
    return MDBX_NEXT;
  case mkv_prev:
    return MDBX_PREV;
  case mkv_next_nodup:
    return MDBX_NEXT_NODUP;
  case mkv_prev_nodup:
    return MDBX_PREV_NODUP;
  case mkv_next_dup:
    return MDBX_NEXT_DUP;
  case mkv_prev_dup:
    return MDBX_PREV_DUP;
  case mkv_first_dup:
    return MDBX_FIRST_DUP;
  case mkv_last_dup:
    return MDBX_LAST_DUP;
  }
  return MDBX_GET_CURRENT;
}

static __inline bool is_valid_op(mkv_cursor_op op) {
  return op >= mkv_first && op <= mkv_last_dup;
}

//----------------------------------------------------------------------------

/* A distinct non-null address for zero-length values. */
static const char mkv_NIL[1] = {0};

static __inline MDBX_val to_val(const slice &src) {
  MDBX_val val;
  val.iov_base = const_cast<void *>(src.iov_len ? src.iov_base
                                                : static_cast<const void *>(
                                                      mkv_NIL));
  val.iov_len = src.iov_len;
  return val;
}

static __inline slice from_val(const MDBX_val &val) {
  return slice(val.iov_base, val.iov_len);
}

static __inline MDBX_env *mdbx(engine_env *env) {
  return reinterpret_cast<MDBX_env *>(env);
}
static __inline MDBX_txn *mdbx(engine_txn *txn) {
  return reinterpret_cast<MDBX_txn *>(txn);
}
static __inline MDBX_cursor *mdbx(engine_cursor *cursor) {
  return reinterpret_cast<MDBX_cursor *>(cursor);
}

static void copy_stat(const MDBX_stat &src, mkv_stat *dst) {
  dst->psize = src.ms_psize;
  dst->depth = src.ms_depth;
  dst->branch_pages = src.ms_branch_pages;
  dst->leaf_pages = src.ms_leaf_pages;
  dst->overflow_pages = src.ms_overflow_pages;
  dst->entries = src.ms_entries;
  dst->mod_txnid = src.ms_mod_txnid;
}

/* The engine does not report the configured table limit back, so it is kept
 * beside the environment as the user context. */
struct mdbx_env_extra {
  unsigned maxdbs;
};

static __inline mdbx_env_extra *extra(engine_env *env) {
  return static_cast<mdbx_env_extra *>(mdbx_env_get_userctx(mdbx(env)));
}

//----------------------------------------------------------------------------

namespace {

class mdbx_engine final : public engine {
public:
  int env_create(engine_env **penv) override {
    *penv = nullptr;
    mdbx_env_extra *ctx = new (std::nothrow) mdbx_env_extra();
    if (unlikely(ctx == nullptr))
      return MKV_ENOMEM;
    ctx->maxdbs = 0;

    MDBX_env *env;
    int rc = mdbx_env_create(&env);
    if (unlikely(rc != MDBX_SUCCESS)) {
      delete ctx;
      return rc;
    }

    rc = mdbx_env_set_userctx(env, ctx);
    if (unlikely(rc != MDBX_SUCCESS)) {
      int err = mdbx_env_close_ex(env, true);
      assert(err == MDBX_SUCCESS);
      (void)err;
      delete ctx;
      return rc;
    }

    *penv = reinterpret_cast<engine_env *>(env);
    return MKV_SUCCESS;
  }

  int env_open(engine_env *env, const char *path, unsigned flags,
               mode_t mode) override {
    return mdbx_env_open(mdbx(env), path, to_mdbx(env_flags_map, flags),
                         mode);
  }

  int env_close(engine_env *env) override {
    mdbx_env_extra *ctx = extra(env);
    const int rc = mdbx_env_close_ex(mdbx(env), false);
    if (likely(rc == MDBX_SUCCESS))
      delete ctx;
    return rc;
  }

  int env_sync(engine_env *env, bool force) override {
    const int rc = mdbx_env_sync_ex(mdbx(env), force, false);
    return (rc == MDBX_RESULT_TRUE) ? MKV_SUCCESS : rc;
  }

  int env_copy(engine_env *env, const char *path, unsigned flags) override {
    return mdbx_env_copy(mdbx(env), path,
                         (flags & mkv_copy_compact) ? MDBX_CP_COMPACT
                                                    : MDBX_CP_DEFAULTS);
  }

  int env_copy2fd(engine_env *env, int fd, unsigned flags) override {
    return mdbx_env_copy2fd(mdbx(env), fd,
                            (flags & mkv_copy_compact) ? MDBX_CP_COMPACT
                                                       : MDBX_CP_DEFAULTS);
  }

  int env_set_flags(engine_env *env, unsigned flags, bool onoff) override {
    return mdbx_env_set_flags(mdbx(env), to_mdbx(env_flags_map, flags),
                              onoff);
  }

  int env_get_flags(engine_env *env, unsigned *flags) override {
    unsigned bits = 0;
    const int rc = mdbx_env_get_flags(mdbx(env), &bits);
    *flags = from_mdbx(env_flags_map, bits);
    return rc;
  }

  /* A fixed-size map, as the legacy mdbx_env_set_mapsize() does. */
  int env_set_mapsize(engine_env *env, size_t size) override {
    return mdbx_env_set_geometry(mdbx(env), intptr_t(size), intptr_t(size),
                                 intptr_t(size), -1, -1, -1);
  }

  int env_set_maxreaders(engine_env *env, unsigned readers) override {
    return mdbx_env_set_maxreaders(mdbx(env), readers);
  }

  int env_get_maxreaders(engine_env *env, unsigned *readers) override {
    return mdbx_env_get_maxreaders(mdbx(env), readers);
  }

  int env_set_maxdbs(engine_env *env, unsigned dbs) override {
    const int rc = mdbx_env_set_maxdbs(mdbx(env), dbs);
    if (likely(rc == MDBX_SUCCESS))
      extra(env)->maxdbs = dbs;
    return rc;
  }

  int env_get_maxdbs(engine_env *env, unsigned *dbs) override {
    *dbs = extra(env)->maxdbs;
    return MKV_SUCCESS;
  }

  int env_get_maxkeysize(engine_env *env, unsigned db_flags,
                         size_t *size) override {
    const int rc =
        mdbx_env_get_maxkeysize_ex(mdbx(env), to_mdbx(db_flags_map, db_flags));
    if (unlikely(rc < 0))
      return MKV_EINVAL;
    *size = size_t(rc);
    return MKV_SUCCESS;
  }

  int env_get_fd(engine_env *env, int *fd) override {
    mdbx_filehandle_t handle;
    const int rc = mdbx_env_get_fd(mdbx(env), &handle);
    if (likely(rc == MDBX_SUCCESS))
      *fd = int(handle);
    return rc;
  }

  int env_stat(engine_env *env, mkv_stat *stat) override {
    MDBX_stat info;
    const int rc = mdbx_env_stat_ex(mdbx(env), nullptr, &info, sizeof(info));
    if (likely(rc == MDBX_SUCCESS))
      copy_stat(info, stat);
    return rc;
  }

  int env_info(engine_env *env, mkv_envinfo *info) override {
    MDBX_envinfo src;
    const int rc = mdbx_env_info_ex(mdbx(env), nullptr, &src, sizeof(src));
    if (unlikely(rc != MDBX_SUCCESS))
      return rc;

    info->geo.lower = src.mi_geo.lower;
    info->geo.upper = src.mi_geo.upper;
    info->geo.current = src.mi_geo.current;
    info->geo.shrink = src.mi_geo.shrink;
    info->geo.grow = src.mi_geo.grow;
    info->mapsize = src.mi_mapsize;
    info->last_pgno = src.mi_last_pgno;
    info->recent_txnid = src.mi_recent_txnid;
    info->latter_reader_txnid = src.mi_latter_reader_txnid;
    info->self_latter_reader_txnid = src.mi_self_latter_reader_txnid;
    info->maxreaders = src.mi_maxreaders;
    info->numreaders = src.mi_numreaders;
    info->dxb_pagesize = src.mi_dxb_pagesize;
    info->sys_pagesize = src.mi_sys_pagesize;
    return MKV_SUCCESS;
  }

  int reader_check(engine_env *env, int *dead) override {
    const int rc = mdbx_reader_check(mdbx(env), dead);
    return (rc == MDBX_RESULT_TRUE) ? MKV_SUCCESS : rc;
  }

  //--------------------------------------------------------------------------

  int txn_begin(engine_env *env, engine_txn *parent, unsigned flags,
                engine_txn **ptxn) override {
    MDBX_txn *txn = nullptr;
    const int rc = mdbx_txn_begin(
        mdbx(env), parent ? mdbx(parent) : nullptr,
        (flags & mkv_txn_readonly) ? unsigned(MDBX_RDONLY) : 0u, &txn);
    *ptxn = reinterpret_cast<engine_txn *>(txn);
    return rc;
  }

  /* A commit which ended up as an abort (i.e. the transaction was already
   * broken) is a failure for the caller. */
  int txn_commit(engine_txn *txn) override {
    const int rc = mdbx_txn_commit(mdbx(txn));
    return (rc == MDBX_RESULT_TRUE) ? MKV_BAD_TXN : rc;
  }

  int txn_abort(engine_txn *txn) override { return mdbx_txn_abort(mdbx(txn)); }
  int txn_reset(engine_txn *txn) override { return mdbx_txn_reset(mdbx(txn)); }
  int txn_renew(engine_txn *txn) override { return mdbx_txn_renew(mdbx(txn)); }

  //--------------------------------------------------------------------------

  int dbi_open(engine_txn *txn, const char *name, unsigned flags,
               engine_dbi *dbi) override {
    MDBX_dbi handle = 0;
    const int rc =
        mdbx_dbi_open(mdbx(txn), name, to_mdbx(db_flags_map, flags), &handle);
    *dbi = handle;
    return rc;
  }

  int dbi_close(engine_env *env, engine_dbi dbi) override {
    return mdbx_dbi_close(mdbx(env), dbi);
  }

  int dbi_stat(engine_txn *txn, engine_dbi dbi, mkv_stat *stat) override {
    MDBX_stat info;
    const int rc = mdbx_dbi_stat(mdbx(txn), dbi, &info, sizeof(info));
    if (likely(rc == MDBX_SUCCESS))
      copy_stat(info, stat);
    return rc;
  }

  int dbi_flags(engine_txn *txn, engine_dbi dbi, unsigned *flags) override {
    unsigned bits = 0, state = 0;
    const int rc = mdbx_dbi_flags_ex(mdbx(txn), dbi, &bits, &state);
    *flags = from_mdbx(db_flags_map, bits) & ~unsigned(mkv_create);
    return rc;
  }

  int drop(engine_txn *txn, engine_dbi dbi, bool del) override {
    return mdbx_drop(mdbx(txn), dbi, del);
  }

  //--------------------------------------------------------------------------

  __hot int get(engine_txn *txn, engine_dbi dbi, const slice &key,
                slice *value) override {
    const MDBX_val k = to_val(key);
    MDBX_val v = {nullptr, 0};
    const int rc = mdbx_get(mdbx(txn), dbi, &k, &v);
    if (likely(rc == MDBX_SUCCESS))
      *value = from_val(v);
    return rc;
  }

  __hot int put(engine_txn *txn, engine_dbi dbi, const slice &key,
                const slice &value, unsigned flags) override {
    const MDBX_val k = to_val(key);
    MDBX_val v = to_val(value);
    return mdbx_put(mdbx(txn), dbi, &k, &v, to_mdbx(put_flags_map, flags));
  }

  int del(engine_txn *txn, engine_dbi dbi, const slice &key,
          const slice *value) override {
    const MDBX_val k = to_val(key);
    if (value == nullptr)
      return mdbx_del(mdbx(txn), dbi, &k, nullptr);
    const MDBX_val v = to_val(*value);
    return mdbx_del(mdbx(txn), dbi, &k, &v);
  }

  int cmp(engine_txn *txn, engine_dbi dbi, const slice &a,
          const slice &b) override {
    const MDBX_val x = to_val(a), y = to_val(b);
    return mdbx_cmp(mdbx(txn), dbi, &x, &y);
  }

  //--------------------------------------------------------------------------

  int cursor_open(engine_txn *txn, engine_dbi dbi,
                  engine_cursor **pcursor) override {
    MDBX_cursor *cursor = nullptr;
    const int rc = mdbx_cursor_open(mdbx(txn), dbi, &cursor);
    *pcursor = reinterpret_cast<engine_cursor *>(cursor);
    return rc;
  }

  void cursor_close(engine_cursor *cursor) override {
    mdbx_cursor_close(mdbx(cursor));
  }

  __hot int cursor_get(engine_cursor *cursor, slice *key, slice *value,
                       mkv_cursor_op op) override {
    if (unlikely(!is_valid_op(op)))
      return MKV_EINVAL;

    MDBX_val k = to_val(*key), v = to_val(*value);
    const int rc = mdbx_cursor_get(mdbx(cursor), &k, &v, to_mdbx(op));
    if (likely(rc == MDBX_SUCCESS)) {
      *key = from_val(k);
      *value = from_val(v);
    }
    return rc;
  }

  int cursor_put(engine_cursor *cursor, const slice &key, const slice &value,
                 unsigned flags) override {
    const MDBX_val k = to_val(key);
    MDBX_val v = to_val(value);
    return mdbx_cursor_put(mdbx(cursor), &k, &v,
                           to_mdbx(put_flags_map, flags));
  }

  int cursor_del(engine_cursor *cursor, unsigned flags) override {
    return mdbx_cursor_del(mdbx(cursor),
                           (flags & mkv_alldups) ? unsigned(MDBX_NODUPDATA)
                                                 : 0u);
  }

  int cursor_count(engine_cursor *cursor, size_t *count) override {
    return mdbx_cursor_count(mdbx(cursor), count);
  }
};

} // namespace

engine *mkv::default_engine() {
  static mdbx_engine instance;
  return &instance;
}

//----------------------------------------------------------------------------

static void mkv_mdbx_logger(MDBX_log_level_t loglevel, const char *function,
                            int line, const char *msg, va_list args) {
  char buf[512];
  const int len = vsnprintf(buf, sizeof(buf), msg, args);
  if (unlikely(len < 0))
    return;
  /* the engine terminates its messages with a newline */
  size_t end = (size_t(len) < sizeof(buf)) ? size_t(len) : sizeof(buf) - 1;
  while (end > 0 && (buf[end - 1] == '\n' || buf[end - 1] == '\r'))
    --end;

  spdlog::level::level_enum level;
  switch (loglevel) {
  case MDBX_LOG_FATAL:
    level = spdlog::level::critical;
    break;
  case MDBX_LOG_ERROR:
    level = spdlog::level::err;
    break;
  case MDBX_LOG_WARN:
    level = spdlog::level::warn;
    break;
  case MDBX_LOG_NOTICE:
  case MDBX_LOG_VERBOSE:
    level = spdlog::level::info;
    break;
  case MDBX_LOG_DEBUG:
    level = spdlog::level::debug;
    break;
  default:
    level = spdlog::level::trace;
    break;
  }
  mkv_log().log(level, "mdbx {}:{} {}", function ? function : "?", line,
                spdlog::string_view_t(buf, end));
}

void mkv_engine_setup_debug(mkv_log_level level, bool trace_engine) {
  MDBX_log_level_t loglevel;
  switch (level) {
  case mkv_log_trace:
    loglevel = trace_engine ? MDBX_LOG_TRACE : MDBX_LOG_VERBOSE;
    break;
  case mkv_log_debug:
    loglevel = trace_engine ? MDBX_LOG_DEBUG : MDBX_LOG_NOTICE;
    break;
  case mkv_log_info:
    loglevel = MDBX_LOG_NOTICE;
    break;
  case mkv_log_warn:
    loglevel = MDBX_LOG_WARN;
    break;
  case mkv_log_error:
    loglevel = MDBX_LOG_ERROR;
    break;
  default:
    loglevel = MDBX_LOG_FATAL;
    break;
  }
  mdbx_setup_debug(loglevel, MDBX_DBG_DONTCHANGE, mkv_mdbx_logger);
}
