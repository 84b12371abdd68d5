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

#pragma once
#include "mkv/engine.h"
#include "mkv/kv.h"
#include "osal.h"

#include <assert.h>
#include <stdlib.h>

#include <atomic>
#include <string>

#include <spdlog/spdlog.h>

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4820) /* bytes padding added after data member       \
                                   for aligment */
#endif                          /* _MSC_VER (warnings) */

typedef uint64_t mkv_shove_t;

struct mkv_dbi_slot {
  mkv_shove_t shove /* zero for an empty slot */;
  mkv::engine_dbi dbi;
  unsigned flags;
  std::string name;

  mkv_dbi_slot() : shove(0), dbi(0), flags(0) {}
};

struct mkv_env;
struct mkv_txn;

/* Control blocks are freed when the last reference is dropped. An
 * environment is referenced by its owner and by every transaction, while a
 * transaction is referenced by its owner, bound views and cursors. */
void mkv_env_retain(mkv_env *env);
void mkv_env_release(mkv_env *env);
void mkv_txn_retain(mkv_txn *txn);
void mkv_txn_release(mkv_txn *txn);

struct mkv_env {
  mkv_env(const mkv_env &) = delete;
  explicit mkv_env(mkv::engine *engine)
      : engine(engine), handle(nullptr), state(mkv::env_state::created),
        flags(0), txn_count(0), refs(1) {}

  mkv::engine *engine;
  mkv::engine_env *handle;
  mkv::env_state state;
  unsigned flags;
  std::atomic<int> txn_count /* engine transactions alive */;
  std::atomic<unsigned> refs;

  mkv_mutex_t dbi_mutex;
  mkv_dbi_slot dbi_cache[MKV_DBI_CACHE_SIZE];
};

struct mkv_txn {
  mkv_txn(const mkv_txn &) = delete;
  mkv_txn(mkv_env *env, unsigned flags)
      : env(env), handle(nullptr), state(mkv::txn_state::invalid),
        flags(flags), snapshot(0), refs(1), parent(nullptr), child(nullptr) {}

  mkv_env *env;
  mkv::engine_txn *handle;
  mkv::txn_state state;
  unsigned flags;
  unsigned snapshot /* bumped by every reset */;
  unsigned refs /* a transaction is not shared between threads */;
  mkv_txn *parent, *child;

  bool readonly() const { return (flags & mkv_txn_readonly) != 0; }
};

struct mkv_cursor {
  mkv_cursor(const mkv_cursor &) = delete;
  mkv_cursor(mkv_txn *txn, mkv::engine_dbi dbi, unsigned db_flags)
      : txn(txn), engine(txn->env->engine), handle(nullptr), dbi(dbi),
        db_flags(db_flags), snapshot(txn->snapshot) {
    mkv_txn_retain(txn);
  }
  ~mkv_cursor() { mkv_txn_release(txn); }

  mkv_txn *txn;
  mkv::engine *engine;
  mkv::engine_cursor *handle;
  mkv::engine_dbi dbi;
  unsigned db_flags;
  unsigned snapshot /* of the transaction when opened */;
};

#ifdef _MSC_VER
#pragma warning(pop)
#endif

//----------------------------------------------------------------------------

/* The "mkv" logger, created on first use. */
spdlog::logger &mkv_log();

class mkv_lock_guard {
  mkv_lock_guard(const mkv_lock_guard &) = delete;
  mkv_mutex_t *_mutex;

public:
  mkv_lock_guard() : _mutex(nullptr) {}

  int lock(mkv_mutex_t *mutex) {
    assert(_mutex == nullptr);
    int err = mkv_mutex_lock(mutex);
    if (likely(err == 0))
      _mutex = mutex;
    return err;
  }

  void unlock() {
    if (_mutex) {
      int err = mkv_mutex_unlock(_mutex);
      assert(err == 0);
      _mutex = nullptr;
      (void)err;
    }
  }

  ~mkv_lock_guard() { unlock(); }
};

//----------------------------------------------------------------------------

__cold int mkv_state_error(const char *op, mkv::env_state required,
                           mkv::env_state actual);
__cold int mkv_state_error(const char *op, mkv::txn_state required,
                           mkv::txn_state actual);
__cold int mkv_stale_cursor(const char *op);

static __inline int mkv_env_validate(const mkv_env *env,
                                     mkv::env_state required, const char *op) {
  if (unlikely(env == nullptr))
    return MKV_EINVAL;
  if (unlikely(env->state != required))
    return mkv_state_error(op, required, env->state);
  return MKV_SUCCESS;
}

static __inline int mkv_txn_validate(const mkv_txn *txn,
                                     mkv::txn_state required, const char *op) {
  if (unlikely(txn == nullptr))
    return MKV_EINVAL;
  if (unlikely(txn->state != required))
    return mkv_state_error(op, required, txn->state);
  return MKV_SUCCESS;
}

static __inline int mkv_cursor_validate(const mkv_cursor *cursor,
                                        const char *op) {
  if (unlikely(cursor == nullptr))
    return MKV_EINVAL;
  int rc = mkv_txn_validate(cursor->txn, mkv::txn_state::normal, op);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  /* the engine cursor is not usable across reset/renew */
  if (unlikely(cursor->snapshot != cursor->txn->snapshot))
    return mkv_stale_cursor(op);
  return MKV_SUCCESS;
}

/* Checks that the handle was issued by the environment of the transaction. */
static __inline int mkv_handle_validate(const mkv_txn *txn,
                                        const mkv_env *handle_env) {
  if (unlikely(handle_env == nullptr))
    return MKV_BAD_DBI;
  if (unlikely(txn->env != handle_env))
    return MKV_FOREIGN_HANDLE;
  return MKV_SUCCESS;
}

//----------------------------------------------------------------------------

/* Aborts the engine transaction after a failure or on request. A failed
 * rollback goes through mkv_panic(). */
int mkv_internal_abort(mkv_txn *txn, int errnum);

/* Moves the transaction (and its nested ones) to the invalid state,
 * accounting the released engine handle. */
void mkv_txn_invalidate(mkv_txn *txn);

/* Drops the owner's reference, aborting an unresolved transaction first.
 * Views which still refer to it see the invalid state. */
void mkv_txn_free(mkv_txn *txn);

int mkv_cursor_open(mkv_txn *txn, mkv::engine_dbi dbi, unsigned db_flags,
                    mkv_cursor **pcursor);
void mkv_cursor_free(mkv_cursor *cursor);

/* Table-name cache */
int mkv_dbicache_open(mkv_env *env, const char *name, unsigned flags,
                      bool create, mkv::engine_dbi *dbi, unsigned *db_flags,
                      bool *owner);
bool mkv_dbicache_remove(mkv_env *env, mkv::engine_dbi dbi);
void mkv_dbicache_clear(mkv_env *env);

/* Engine-side diagnostics, routed into mkv_log(). */
void mkv_engine_setup_debug(mkv_log_level level, bool trace_engine);
