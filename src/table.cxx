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

database::database(mkv_txn *txn, const db_handle &handle) noexcept
    : txn_(txn), handle_(handle) {
  mkv_txn_retain(txn_);
}

database::database(const database &other) noexcept
    : txn_(other.txn_), handle_(other.handle_) {
  mkv_txn_retain(txn_);
}

database &database::operator=(const database &other) noexcept {
  mkv_txn_retain(other.txn_);
  mkv_txn_release(txn_);
  txn_ = other.txn_;
  handle_ = other.handle_;
  return *this;
}

database &database::operator=(database &&other) noexcept {
  if (this != &other) {
    mkv_txn_release(txn_);
    txn_ = other.txn_;
    other.txn_ = nullptr;
    handle_ = std::move(other.handle_);
  }
  return *this;
}

database::~database() { mkv_txn_release(txn_); }

int database::validate(const char *op) const {
  int rc = mkv_txn_validate(txn_, txn_state::normal, op);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return mkv_handle_validate(txn_, handle_.env_);
}

__hot int database::get_slice(const slice &key, slice *value) const {
  int rc = validate("get");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return txn_->env->engine->get(txn_->handle, handle_.dbi(), key, value);
}

result<mkv_stat> database::stat() const {
  int rc = validate("stat");
  if (unlikely(rc != MKV_SUCCESS))
    return result<mkv_stat>(rc);

  mkv_stat stat;
  memset(&stat, 0, sizeof(stat));
  rc = txn_->env->engine->dbi_stat(txn_->handle, handle_.dbi(), &stat);
  return result<mkv_stat>(rc, stat);
}

//----------------------------------------------------------------------------

__hot int writable_database::put(const slice &key, const slice &value,
                                 unsigned flags) {
  int rc = validate("put");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return txn_->env->engine->put(txn_->handle, handle_.dbi(), key, value,
                                flags);
}

int writable_database::erase(const slice &key, const slice *value) {
  int rc = validate(value ? "del_exact" : "del");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return txn_->env->engine->del(txn_->handle, handle_.dbi(), key, value);
}

int writable_database::clear() {
  int rc = validate("clear");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return txn_->env->engine->drop(txn_->handle, handle_.dbi(), false);
}

__cold int writable_database::del_db() {
  int rc = validate("del_db");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  mkv_env *env = txn_->env;
  rc = env->engine->drop(txn_->handle, handle_.dbi(), true);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  /* the engine has closed the handle, so no copy may hit the cache anymore */
  mkv_lock_guard guard;
  rc = guard.lock(&env->dbi_mutex);
  if (unlikely(rc != 0))
    return rc;
  if (!mkv_dbicache_remove(env, handle_.dbi()))
    mkv_log().debug("dropped dbi {} was not cached", handle_.dbi());
  return MKV_SUCCESS;
}
