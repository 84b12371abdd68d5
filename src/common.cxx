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

#include <new>

#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif

using namespace mkv;

//----------------------------------------------------------------------------
/* Filesystem */

int mkv_path_inspect(const char *path, mkv_path_kind *kind) {
  struct stat st;
  if (stat(path, &st) != 0) {
    const int err = errno;
    if (err != ENOENT && err != ENOTDIR)
      return err;
    *kind = mkv_path_absent;
    return MKV_SUCCESS;
  }
  *kind = S_ISDIR(st.st_mode) ? mkv_path_dir : mkv_path_file;
  return MKV_SUCCESS;
}

int mkv_mkdir_p(const char *path, mode_t mode) {
  std::string partial(path);
  for (size_t i = 1; i <= partial.size(); ++i) {
    if (i < partial.size() && partial[i] != '/')
      continue;

    const char saved = (i < partial.size()) ? partial[i] : '\0';
    partial[i] = '\0';
    if (mkdir(partial.c_str(), mode) != 0) {
      const int err = errno;
      mkv_path_kind kind;
      if (err != EEXIST || mkv_path_inspect(partial.c_str(), &kind) != 0 ||
          kind != mkv_path_dir)
        return err ? err : MKV_EOOPS;
    }
    if (i < partial.size())
      partial[i] = saved;
  }
  return MKV_SUCCESS;
}

/* The directory (or the data file with mkv_nosubdir) must be of the expected
 * kind, a missing directory is created on demand. */
static __cold int mkv_check_path(const char *path, unsigned flags, mode_t mode,
                                 bool autocreate_dir) {
  mkv_path_kind kind;
  int rc = mkv_path_inspect(path, &kind);
  if (unlikely(rc != MKV_SUCCESS)) {
    mkv_log().error("unable to inspect '{}': {}", path, mkv_strerror(rc));
    return MKV_INVALID_PATH;
  }

  if (flags & mkv_nosubdir) {
    if (unlikely(kind == mkv_path_dir)) {
      mkv_log().error("'{}' is a directory, but a data file is expected", path);
      return MKV_INVALID_PATH;
    }
    return MKV_SUCCESS;
  }

  switch (kind) {
  case mkv_path_dir:
    return MKV_SUCCESS;
  case mkv_path_file:
    mkv_log().error("'{}' is a file, but a directory is expected", path);
    return MKV_INVALID_PATH;
  default:
    if (!autocreate_dir || (flags & mkv_readonly))
      return MKV_SUCCESS /* let the engine report */;
    /* the directory gets search permission wherever read is allowed */
    rc = mkv_mkdir_p(path, mode | ((mode & 0444) >> 2));
    if (unlikely(rc != MKV_SUCCESS)) {
      mkv_log().error("unable to create directory '{}': {}", path,
                      mkv_strerror(rc));
      return MKV_INVALID_PATH;
    }
    mkv_log().debug("created directory '{}'", path);
    return MKV_SUCCESS;
  }
}

//----------------------------------------------------------------------------

int mkv_state_error(const char *op, env_state required, env_state actual) {
  mkv_log().debug("{} requires the {} environment, but it is {}", op,
                  std::to_string(required), std::to_string(actual));
  return MKV_STATE_MISMATCH;
}

int mkv_state_error(const char *op, txn_state required, txn_state actual) {
  mkv_log().debug("{} requires the {} transaction, but it is {}", op,
                  std::to_string(required), std::to_string(actual));
  return MKV_STATE_MISMATCH;
}

int mkv_stale_cursor(const char *op) {
  mkv_log().debug("{} on a cursor of a previous snapshot", op);
  return MKV_STATE_MISMATCH;
}

int
#if defined(__GNUC__) || __has_attribute(weak)
    __attribute__((weak))
#endif
    mkv_panic(int errnum_initial, int errnum_fatal) {
  (void)errnum_initial;
  (void)errnum_fatal;
  return (MKV_ENABLE_ABORT_ON_PANIC) ? 0 : -1;
}

//----------------------------------------------------------------------------

static void mkv_env_destroy(mkv_env *env) {
  if (env->handle) {
    int err = env->engine->env_close(env->handle);
    if (unlikely(err != MKV_SUCCESS))
      mkv_log().error("environment close failed: {}", mkv_strerror(err));
    env->handle = nullptr;
  }
  int err = mkv_mutex_destroy(&env->dbi_mutex);
  assert(err == 0);
  (void)err;
  delete env;
}

void mkv_env_retain(mkv_env *env) { ++env->refs; }

void mkv_env_release(mkv_env *env) {
  if (--env->refs == 0)
    mkv_env_destroy(env);
}

static int mkv_env_close(mkv_env *env) {
  mkv_lock_guard guard;
  int rc = guard.lock(&env->dbi_mutex);
  if (unlikely(rc != 0))
    return rc;

  mkv_dbicache_clear(env);
  rc = env->engine->env_close(env->handle);
  env->handle = nullptr;
  env->state = env_state::closed;
  mkv_log().debug("environment {} closed", static_cast<const void *>(env));
  return rc;
}

/* While transactions are alive the engine environment stays open, and it
 * is closed along with the last of them. */
static void mkv_env_drop_owner(mkv_env *env) {
  const int alive = env->txn_count.load();
  if (unlikely(alive > 0)) {
    mkv_log().warn("environment {} outlived by {} transaction(s)",
                   static_cast<const void *>(env), alive);
  } else if (env->handle) {
    int err = mkv_env_close(env);
    if (unlikely(err != MKV_SUCCESS))
      mkv_log().error("environment close failed: {}", mkv_strerror(err));
  }
  mkv_env_release(env);
}

environment &environment::operator=(environment &&other) noexcept {
  if (this != &other) {
    if (env_)
      mkv_env_drop_owner(env_);
    env_ = other.env_;
    other.env_ = nullptr;
  }
  return *this;
}

environment::~environment() {
  if (env_)
    mkv_env_drop_owner(env_);
}

result<environment> environment::create(engine *engine) {
  if (engine == nullptr)
    engine = default_engine();

  mkv_env *env = new (std::nothrow) mkv_env(engine);
  if (unlikely(env == nullptr))
    return result<environment>(MKV_ENOMEM);

  int rc = mkv_mutex_init(&env->dbi_mutex);
  if (unlikely(rc != 0)) {
    delete env;
    return result<environment>(rc);
  }

  rc = engine->env_create(&env->handle);
  if (unlikely(rc != MKV_SUCCESS)) {
    env->handle = nullptr;
    mkv_env_destroy(env);
    return result<environment>(rc);
  }

  return result<environment>(MKV_SUCCESS, environment(env));
}

result<environment> environment::create_or_open(const char *path,
                                                const env_options &options,
                                                engine *engine) {
  result<environment> env = create(engine);
  if (unlikely(!env.ok()))
    return env;

  int rc = MKV_SUCCESS;
  if (options.max_readers)
    rc = env.value.set_max_readers(options.max_readers);
  if (likely(rc == MKV_SUCCESS) && options.max_databases)
    rc = env.value.set_max_databases(options.max_databases);
  if (likely(rc == MKV_SUCCESS) && options.map_size)
    rc = env.value.set_map_size(options.map_size);
  if (likely(rc == MKV_SUCCESS))
    rc = env.value.open(path, options.flags, options.mode,
                        options.autocreate_dir);
  if (unlikely(rc != MKV_SUCCESS))
    return result<environment>(rc);

  return env;
}

env_state environment::state() const noexcept {
  return env_ ? env_->state : env_state::closed;
}

int environment::set_map_size(size_t size) {
  int rc = mkv_env_validate(env_, env_state::created, "set_map_size");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return env_->engine->env_set_mapsize(env_->handle, size);
}

int environment::set_max_readers(unsigned readers) {
  int rc = mkv_env_validate(env_, env_state::created, "set_max_readers");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return env_->engine->env_set_maxreaders(env_->handle, readers);
}

int environment::set_max_databases(unsigned count) {
  int rc = mkv_env_validate(env_, env_state::created, "set_max_databases");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return env_->engine->env_set_maxdbs(env_->handle, count);
}

int environment::open(const char *path, unsigned flags, mode_t mode,
                      bool autocreate_dir) {
  int rc = mkv_env_validate(env_, env_state::created, "open");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  if (unlikely(path == nullptr || *path == '\0'))
    return MKV_EINVAL;

  int err;
  rc = mkv_check_path(path, flags, mode, autocreate_dir);
  if (unlikely(rc != MKV_SUCCESS))
    goto bailout;

  rc = env_->engine->env_open(env_->handle, path, flags, mode);
  if (unlikely(rc != MKV_SUCCESS)) {
    mkv_log().error("unable to open environment '{}': {}", path,
                    mkv_strerror(rc));
    goto bailout;
  }

  env_->flags = flags;
  env_->state = env_state::opened;
  mkv_log().info("environment '{}' opened", path);
  return MKV_SUCCESS;

bailout:
  err = env_->engine->env_close(env_->handle);
  if (unlikely(err != MKV_SUCCESS))
    mkv_log().warn("release of a failed environment: {}", mkv_strerror(err));
  env_->handle = nullptr;
  env_->state = env_state::closed;
  return rc;
}

int environment::close() {
  if (env_ == nullptr || env_->state == env_state::closed)
    return MKV_SUCCESS;

  const int alive = env_->txn_count.load();
  if (unlikely(alive > 0)) {
    mkv_log().warn("unable to close environment with {} live transaction(s)",
                   alive);
    return MKV_EBUSY;
  }

  return mkv_env_close(env_);
}

//----------------------------------------------------------------------------
/* Maintenance */

int environment::sync(bool force) {
  int rc = mkv_env_validate(env_, env_state::opened, "sync");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return env_->engine->env_sync(env_->handle, force);
}

int environment::copy_to_path(const char *path, unsigned flags) {
  if (unlikely(path == nullptr || *path == '\0'))
    return MKV_EINVAL;
  int rc = mkv_env_validate(env_, env_state::opened, "copy_to_path");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return env_->engine->env_copy(env_->handle, path, flags);
}

int environment::copy_to_fd(int fd, unsigned flags) {
  if (unlikely(fd < 0))
    return MKV_EINVAL;
  int rc = mkv_env_validate(env_, env_state::opened, "copy_to_fd");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return env_->engine->env_copy2fd(env_->handle, fd, flags);
}

result<mkv_stat> environment::stat() const {
  int rc = mkv_env_validate(env_, env_state::opened, "stat");
  if (unlikely(rc != MKV_SUCCESS))
    return result<mkv_stat>(rc);
  mkv_stat stat;
  memset(&stat, 0, sizeof(stat));
  rc = env_->engine->env_stat(env_->handle, &stat);
  return result<mkv_stat>(rc, stat);
}

result<mkv_envinfo> environment::info() const {
  int rc = mkv_env_validate(env_, env_state::opened, "info");
  if (unlikely(rc != MKV_SUCCESS))
    return result<mkv_envinfo>(rc);
  mkv_envinfo info;
  memset(&info, 0, sizeof(info));
  rc = env_->engine->env_info(env_->handle, &info);
  return result<mkv_envinfo>(rc, info);
}

result<int> environment::reader_check() {
  int rc = mkv_env_validate(env_, env_state::opened, "reader_check");
  if (unlikely(rc != MKV_SUCCESS))
    return result<int>(rc);
  int dead = 0;
  rc = env_->engine->reader_check(env_->handle, &dead);
  return result<int>(rc, dead);
}

int environment::set_flags(unsigned flags, bool onoff) {
  int rc = mkv_env_validate(env_, env_state::opened, "set_flags");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  rc = env_->engine->env_set_flags(env_->handle, flags, onoff);
  if (likely(rc == MKV_SUCCESS))
    env_->flags = onoff ? (env_->flags | flags) : (env_->flags & ~flags);
  return rc;
}

result<unsigned> environment::get_flags() const {
  int rc = mkv_env_validate(env_, env_state::opened, "get_flags");
  if (unlikely(rc != MKV_SUCCESS))
    return result<unsigned>(rc);
  unsigned flags = 0;
  rc = env_->engine->env_get_flags(env_->handle, &flags);
  return result<unsigned>(rc, flags);
}

result<size_t> environment::get_map_size() const {
  const result<mkv_envinfo> envinfo = info();
  return envinfo.ok() ? result<size_t>(MKV_SUCCESS,
                                       size_t(envinfo.value.mapsize))
                      : result<size_t>(envinfo.err);
}

result<unsigned> environment::get_max_readers() const {
  int rc = mkv_env_validate(env_, env_state::opened, "get_max_readers");
  if (unlikely(rc != MKV_SUCCESS))
    return result<unsigned>(rc);
  unsigned readers = 0;
  rc = env_->engine->env_get_maxreaders(env_->handle, &readers);
  return result<unsigned>(rc, readers);
}

result<unsigned> environment::get_max_databases() const {
  int rc = mkv_env_validate(env_, env_state::opened, "get_max_databases");
  if (unlikely(rc != MKV_SUCCESS))
    return result<unsigned>(rc);
  unsigned count = 0;
  rc = env_->engine->env_get_maxdbs(env_->handle, &count);
  return result<unsigned>(rc, count);
}

result<size_t> environment::get_max_keysize(unsigned db_flags) const {
  int rc = mkv_env_validate(env_, env_state::opened, "get_max_keysize");
  if (unlikely(rc != MKV_SUCCESS))
    return result<size_t>(rc);
  size_t size = 0;
  rc = env_->engine->env_get_maxkeysize(env_->handle, db_flags, &size);
  return result<size_t>(rc, size);
}

result<int> environment::get_fd() const {
  int rc = mkv_env_validate(env_, env_state::opened, "get_fd");
  if (unlikely(rc != MKV_SUCCESS))
    return result<int>(rc);
  int fd = -1;
  rc = env_->engine->env_get_fd(env_->handle, &fd);
  return result<int>(rc, fd);
}

//----------------------------------------------------------------------------
/* Transactions */

static int mkv_txn_begin(mkv_env *env, mkv_txn *parent, unsigned flags,
                         mkv_txn **ptxn) {
  *ptxn = nullptr;
  mkv_txn *txn = new (std::nothrow) mkv_txn(env, flags);
  if (unlikely(txn == nullptr))
    return MKV_ENOMEM;

  const int rc = env->engine->txn_begin(
      env->handle, parent ? parent->handle : nullptr, flags, &txn->handle);
  if (unlikely(rc != MKV_SUCCESS)) {
    mkv_log().debug("begin of {} transaction failed: {}",
                    (flags & mkv_txn_readonly) ? "read-only" : "read-write",
                    mkv_strerror(rc));
    delete txn;
    return rc;
  }

  ++env->txn_count;
  mkv_env_retain(env);
  txn->state = txn_state::normal;
  if (parent) {
    txn->parent = parent;
    parent->child = txn;
  }
  *ptxn = txn;
  return MKV_SUCCESS;
}

void mkv_txn_invalidate(mkv_txn *txn) {
  if (txn->child)
    mkv_txn_invalidate(txn->child);
  if (txn->handle) {
    txn->handle = nullptr;
    --txn->env->txn_count;
  }
  txn->state = txn_state::invalid;
  if (txn->parent) {
    txn->parent->child = nullptr;
    txn->parent = nullptr;
  }
}

int mkv_internal_abort(mkv_txn *txn, int errnum) {
  /* The engine aborts nested transactions along with the parent, so the
   * whole chain becomes invalid whatever the outcome. */
  int rc = txn->env->engine->txn_abort(txn->handle);
  mkv_txn_invalidate(txn);

  if (unlikely(rc != MKV_SUCCESS)) {
    switch (rc) {
    case MKV_EBADSIGN /* already aborted read-only txn */:
    /* fallthrough */
    case MKV_BAD_TXN /* already aborted read-write txn */:
      mkv_log().warn("rollback of an already finished transaction: {}",
                     mkv_strerror(rc));
      break;
    default:
      mkv_log().critical("transaction rollback failed: {} (initial error {})",
                         mkv_strerror(rc), mkv_strerror(errnum));
      if (!mkv_panic(errnum, rc))
        abort();
      errnum = MKV_WANNA_DIE;
    }
  }
  return errnum;
}

void mkv_txn_retain(mkv_txn *txn) {
  if (txn)
    ++txn->refs;
}

void mkv_txn_release(mkv_txn *txn) {
  if (txn == nullptr || --txn->refs > 0)
    return;
  assert(txn->handle == nullptr && txn->child == nullptr);
  mkv_env *env = txn->env;
  delete txn;
  mkv_env_release(env);
}

void mkv_txn_free(mkv_txn *txn) {
  if (txn->handle) {
    mkv_log().debug("aborting an unresolved transaction {}",
                    static_cast<const void *>(txn));
    int err = mkv_internal_abort(txn, MKV_SUCCESS);
    (void)err;
  }
  mkv_txn_invalidate(txn);
  mkv_txn_release(txn);
}

result<transaction> environment::new_transaction() {
  int rc = mkv_env_validate(env_, env_state::opened, "new_transaction");
  if (unlikely(rc != MKV_SUCCESS))
    return result<transaction>(rc);

  mkv_txn *txn;
  rc = mkv_txn_begin(env_, nullptr, mkv_txn_readwrite, &txn);
  if (unlikely(rc != MKV_SUCCESS))
    return result<transaction>(rc);
  return result<transaction>(MKV_SUCCESS, transaction(txn));
}

result<readonly_transaction> environment::get_reader() {
  int rc = mkv_env_validate(env_, env_state::opened, "get_reader");
  if (unlikely(rc != MKV_SUCCESS))
    return result<readonly_transaction>(rc);

  mkv_txn *txn;
  rc = mkv_txn_begin(env_, nullptr, mkv_txn_readonly, &txn);
  if (unlikely(rc != MKV_SUCCESS))
    return result<readonly_transaction>(rc);
  return result<readonly_transaction>(MKV_SUCCESS, readonly_transaction(txn));
}

transaction_base &transaction_base::
operator=(transaction_base &&other) noexcept {
  if (this != &other) {
    if (txn_)
      mkv_txn_free(txn_);
    txn_ = other.txn_;
    other.txn_ = nullptr;
  }
  return *this;
}

transaction_base::~transaction_base() {
  if (txn_)
    mkv_txn_free(txn_);
}

txn_state transaction_base::state() const noexcept {
  return txn_ ? txn_->state : txn_state::invalid;
}

bool transaction_base::is_readonly() const noexcept {
  return txn_ && txn_->readonly();
}

int transaction_base::end(bool abort) {
  if (unlikely(txn_ == nullptr))
    return MKV_EINVAL;

  if (abort) {
    /* idempotent: an already finished transaction has nothing to roll back */
    if (txn_->state == txn_state::invalid)
      return MKV_SUCCESS;
    return mkv_internal_abort(txn_, MKV_SUCCESS);
  }

  int rc = mkv_txn_validate(txn_, txn_state::normal, "commit");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  if (unlikely(txn_->child != nullptr)) {
    mkv_log().debug("commit of a transaction with an unresolved nested one");
    return MKV_STATE_MISMATCH;
  }

  /* The engine releases the handle whatever the outcome. */
  rc = txn_->env->engine->txn_commit(txn_->handle);
  mkv_txn_invalidate(txn_);
  if (unlikely(rc != MKV_SUCCESS))
    mkv_log().debug("commit failed: {}", mkv_strerror(rc));
  return rc;
}

result<transaction> transaction::new_child() {
  int rc = mkv_txn_validate(txn_, txn_state::normal, "new_child");
  if (unlikely(rc != MKV_SUCCESS))
    return result<transaction>(rc);
  if (unlikely(txn_->child != nullptr)) {
    mkv_log().debug("transaction {} already has a nested one",
                    static_cast<const void *>(txn_));
    return result<transaction>(MKV_STATE_MISMATCH);
  }

  mkv_txn *child;
  rc = mkv_txn_begin(txn_->env, txn_, mkv_txn_readwrite, &child);
  if (unlikely(rc != MKV_SUCCESS))
    return result<transaction>(rc);
  return result<transaction>(MKV_SUCCESS, transaction(child));
}

static int mkv_txn_reset(mkv_txn *txn, const char *op) {
  int rc = mkv_txn_validate(txn, txn_state::normal, op);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  rc = txn->env->engine->txn_reset(txn->handle);
  if (likely(rc == MKV_SUCCESS)) {
    txn->state = txn_state::released;
    ++txn->snapshot;
    return MKV_SUCCESS;
  }
  return mkv_internal_abort(txn, rc);
}

int readonly_transaction::commit() { return mkv_txn_reset(txn_, "commit"); }

int readonly_transaction::reset() { return mkv_txn_reset(txn_, "reset"); }

int readonly_transaction::renew() {
  int rc = mkv_txn_validate(txn_, txn_state::released, "renew");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  rc = txn_->env->engine->txn_renew(txn_->handle);
  if (likely(rc == MKV_SUCCESS)) {
    txn_->state = txn_state::normal;
    return MKV_SUCCESS;
  }
  return mkv_internal_abort(txn_, rc);
}
