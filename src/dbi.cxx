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

#include <t1ha.h>

using namespace mkv;

/* Shoves of live entries are odd, so a removed slot keeps the collision chain
 * going without ever matching. */
static const mkv_shove_t mkv_shove_tombstone = 2;

static __inline mkv_shove_t mkv_shove_name(const char *name, size_t len) {
  return t1ha2_atonce(name, len, UINT64_C(20201019151731)) | 1;
}

static __inline bool mkv_slot_is_free(const mkv_dbi_slot &slot) {
  return slot.shove == 0 || slot.shove == mkv_shove_tombstone;
}

static __hot const mkv_dbi_slot *mkv_dbicache_lookup(const mkv_env *env,
                                                     mkv_shove_t shove,
                                                     const char *name,
                                                     size_t len) {
  const size_t n = shove % MKV_DBI_CACHE_SIZE;
  size_t i = n;
  do {
    const mkv_dbi_slot &slot = env->dbi_cache[i];
    if (slot.shove == shove && slot.name.size() == len &&
        memcmp(slot.name.data(), name, len) == 0)
      return &slot;
    i = (i + 1) % MKV_DBI_CACHE_SIZE;
  } while (i != n && env->dbi_cache[i].shove);

  return nullptr;
}

static void mkv_dbicache_update(mkv_env *env, mkv_shove_t shove,
                                const char *name, size_t len, engine_dbi dbi,
                                unsigned flags) {
  assert(shove & 1);

  const size_t n = shove % MKV_DBI_CACHE_SIZE;
  size_t i = n;
  do {
    mkv_dbi_slot &slot = env->dbi_cache[i];
    if (mkv_slot_is_free(slot)) {
      slot.name.assign(name, len);
      slot.dbi = dbi;
      slot.flags = flags;
      slot.shove = shove;
      return;
    }
    i = (i + 1) % MKV_DBI_CACHE_SIZE;
  } while (i != n);

  mkv_log().warn("table-name cache is full, '{}' stays uncached",
                 std::string(name, len));
}

__cold bool mkv_dbicache_remove(mkv_env *env, engine_dbi dbi) {
  bool found = false;
  for (size_t i = 0; i < MKV_DBI_CACHE_SIZE; ++i) {
    mkv_dbi_slot &slot = env->dbi_cache[i];
    if (!mkv_slot_is_free(slot) && slot.dbi == dbi) {
      slot.shove = mkv_shove_tombstone;
      slot.name.clear();
      slot.dbi = 0;
      slot.flags = 0;
      found = true;
    }
  }
  return found;
}

__cold void mkv_dbicache_clear(mkv_env *env) {
  for (size_t i = 0; i < MKV_DBI_CACHE_SIZE; ++i) {
    mkv_dbi_slot &slot = env->dbi_cache[i];
    slot.shove = 0;
    slot.name.clear();
    slot.dbi = 0;
    slot.flags = 0;
  }
}

static int mkv_dbicache_hit(const mkv_dbi_slot *slot, unsigned flags,
                            engine_dbi *dbi, unsigned *db_flags) {
  if (unlikely(flags != 0 && flags != slot->flags)) {
    mkv_log().debug("table '{}' has flags {:#x}, requested {:#x}", slot->name,
                    slot->flags, flags);
    return MKV_INCOMPATIBLE;
  }
  *dbi = slot->dbi;
  *db_flags = slot->flags;
  return MKV_SUCCESS;
}

/* Opening a table takes a short internal transaction, which is write one
 * unless the environment is read-only. The engine serializes writers, so the
 * cache is looked up a second time after the transaction has started and
 * only one of the concurrent openers of a name reaches the engine. The
 * mutex is never held while waiting for the writer lock, since a thread may
 * enter here (via del_db) while holding its own write transaction. */
__cold int mkv_dbicache_open(mkv_env *env, const char *name, unsigned flags,
                             bool create, engine_dbi *dbi, unsigned *db_flags,
                             bool *owner) {
  const char *const key = name ? name : "";
  const size_t len = strlen(key);
  const mkv_shove_t shove = mkv_shove_name(key, len);
  flags &= ~unsigned(mkv_create);
  *owner = false;

  mkv_lock_guard guard;
  int rc = guard.lock(&env->dbi_mutex);
  if (unlikely(rc != 0))
    return rc;

  const mkv_dbi_slot *slot = mkv_dbicache_lookup(env, shove, key, len);
  if (likely(slot))
    return mkv_dbicache_hit(slot, flags, dbi, db_flags);
  guard.unlock();

  engine *const engine = env->engine;
  engine_txn *txn = nullptr;
  rc = engine->txn_begin(env->handle, nullptr,
                         (env->flags & mkv_readonly) ? mkv_txn_readonly
                                                     : mkv_txn_readwrite,
                         &txn);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  int err;
  rc = guard.lock(&env->dbi_mutex);
  if (unlikely(rc != 0))
    goto bailout;

  slot = mkv_dbicache_lookup(env, shove, key, len);
  if (slot) {
    rc = mkv_dbicache_hit(slot, flags, dbi, db_flags);
    goto bailout;
  }

  rc = engine->dbi_open(txn, len ? key : nullptr,
                        create ? flags | mkv_create : flags, dbi);
  if (likely(rc == MKV_SUCCESS))
    rc = engine->dbi_flags(txn, *dbi, db_flags);
  if (unlikely(rc != MKV_SUCCESS)) {
    mkv_log().debug("unable to open table '{}': {}", key, mkv_strerror(rc));
    goto bailout;
  }

  rc = engine->txn_commit(txn);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  mkv_dbicache_update(env, shove, key, len, *dbi, *db_flags);
  *owner = true;
  mkv_log().debug("table '{}' opened as dbi {}", key, *dbi);
  return MKV_SUCCESS;

bailout:
  err = engine->txn_abort(txn);
  if (unlikely(err != MKV_SUCCESS))
    mkv_log().warn("abort of a table-open transaction: {}", mkv_strerror(err));
  return rc;
}

//----------------------------------------------------------------------------

result<db_handle> environment::open_database(const char *name, unsigned flags,
                                             bool create) {
  int rc = mkv_env_validate(env_, env_state::opened,
                            create ? "get_or_create_database"
                                   : "get_database");
  if (unlikely(rc != MKV_SUCCESS))
    return result<db_handle>(rc);

  engine_dbi dbi = 0;
  unsigned db_flags = 0;
  bool owner = false;
  rc = mkv_dbicache_open(env_, name, flags, create, &dbi, &db_flags, &owner);
  if (unlikely(rc != MKV_SUCCESS))
    return result<db_handle>(rc);
  return result<db_handle>(MKV_SUCCESS, db_handle(env_, dbi, db_flags, owner));
}

result<db_handle> environment::get_database(const char *name, unsigned flags) {
  if (unlikely(name == nullptr))
    return result<db_handle>(MKV_EINVAL);
  return open_database(name, flags, false);
}

result<db_handle> environment::get_or_create_database(const char *name,
                                                      unsigned flags) {
  if (unlikely(name == nullptr))
    return result<db_handle>(MKV_EINVAL);
  return open_database(name, flags, (env_ == nullptr) ||
                                        !(env_->flags & mkv_readonly));
}

result<db_handle> environment::get_default_database(unsigned flags) {
  /* the unnamed table always exists, flags are applied only while empty */
  return open_database(nullptr, flags, flags != 0);
}

int environment::close_database(db_handle &handle) {
  int rc = mkv_env_validate(env_, env_state::opened, "close_database");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  if (unlikely(handle.env_ != env_))
    return handle.env_ ? MKV_FOREIGN_HANDLE : MKV_BAD_DBI;
  if (unlikely(!handle.owner_))
    return MKV_EPERM;

  mkv_lock_guard guard;
  rc = guard.lock(&env_->dbi_mutex);
  if (unlikely(rc != 0))
    return rc;
  mkv_dbicache_remove(env_, handle.dbi_);
  guard.unlock();

  rc = env_->engine->dbi_close(env_->handle, handle.dbi_);
  handle = db_handle();
  return rc;
}
