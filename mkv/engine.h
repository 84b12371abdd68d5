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

/* The storage engine seam.
 *
 * The library reaches the engine only through this interface, so tests may
 * substitute a decorating (counting, failing) implementation. All calls
 * return an error code in terms of mkv_error and deliver results through
 * out-parameters. Flags are the library's own mkv_*_flags values, the
 * implementation translates them. */

#pragma once

#include "mkv/kv.h"

namespace mkv {

struct engine_env;
struct engine_txn;
struct engine_cursor;
typedef unsigned engine_dbi;

class MKV_API engine {
public:
  virtual ~engine();

  /* Environment */
  virtual int env_create(engine_env **penv) = 0;
  virtual int env_open(engine_env *env, const char *path, unsigned flags,
                       mode_t mode) = 0;
  virtual int env_close(engine_env *env) = 0;
  virtual int env_sync(engine_env *env, bool force) = 0;
  virtual int env_copy(engine_env *env, const char *path, unsigned flags) = 0;
  virtual int env_copy2fd(engine_env *env, int fd, unsigned flags) = 0;
  virtual int env_set_flags(engine_env *env, unsigned flags, bool onoff) = 0;
  virtual int env_get_flags(engine_env *env, unsigned *flags) = 0;
  virtual int env_set_mapsize(engine_env *env, size_t size) = 0;
  virtual int env_set_maxreaders(engine_env *env, unsigned readers) = 0;
  virtual int env_get_maxreaders(engine_env *env, unsigned *readers) = 0;
  virtual int env_set_maxdbs(engine_env *env, unsigned dbs) = 0;
  virtual int env_get_maxdbs(engine_env *env, unsigned *dbs) = 0;
  virtual int env_get_maxkeysize(engine_env *env, unsigned db_flags,
                                 size_t *size) = 0;
  virtual int env_get_fd(engine_env *env, int *fd) = 0;
  virtual int env_stat(engine_env *env, mkv_stat *stat) = 0;
  virtual int env_info(engine_env *env, mkv_envinfo *info) = 0;
  virtual int reader_check(engine_env *env, int *dead) = 0;

  /* Transactions */
  virtual int txn_begin(engine_env *env, engine_txn *parent, unsigned flags,
                        engine_txn **ptxn) = 0;
  virtual int txn_commit(engine_txn *txn) = 0;
  virtual int txn_abort(engine_txn *txn) = 0;
  virtual int txn_reset(engine_txn *txn) = 0;
  virtual int txn_renew(engine_txn *txn) = 0;

  /* Tables, name == nullptr stands for the unnamed main table */
  virtual int dbi_open(engine_txn *txn, const char *name, unsigned flags,
                       engine_dbi *dbi) = 0;
  virtual int dbi_close(engine_env *env, engine_dbi dbi) = 0;
  virtual int dbi_stat(engine_txn *txn, engine_dbi dbi, mkv_stat *stat) = 0;
  virtual int dbi_flags(engine_txn *txn, engine_dbi dbi, unsigned *flags) = 0;
  virtual int drop(engine_txn *txn, engine_dbi dbi, bool del) = 0;

  /* Data, value == nullptr in del() removes all values of the key */
  virtual int get(engine_txn *txn, engine_dbi dbi, const slice &key,
                  slice *value) = 0;
  virtual int put(engine_txn *txn, engine_dbi dbi, const slice &key,
                  const slice &value, unsigned flags) = 0;
  virtual int del(engine_txn *txn, engine_dbi dbi, const slice &key,
                  const slice *value) = 0;
  virtual int cmp(engine_txn *txn, engine_dbi dbi, const slice &a,
                  const slice &b) = 0;

  /* Cursors */
  virtual int cursor_open(engine_txn *txn, engine_dbi dbi,
                          engine_cursor **pcursor) = 0;
  virtual void cursor_close(engine_cursor *cursor) = 0;
  virtual int cursor_get(engine_cursor *cursor, slice *key, slice *value,
                         mkv_cursor_op op) = 0;
  virtual int cursor_put(engine_cursor *cursor, const slice &key,
                         const slice &value, unsigned flags) = 0;
  virtual int cursor_del(engine_cursor *cursor, unsigned flags) = 0;
  virtual int cursor_count(engine_cursor *cursor, size_t *count) = 0;
};

/* The libmdbx-backed engine, a process-wide singleton. */
MKV_API engine *default_engine();

} // namespace mkv
