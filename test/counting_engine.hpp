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

#include <atomic>

/* Engine decorator which forwards everything to the real engine while
 * counting the calls, so tests can check that a state-guarded operation
 * never reached the engine. A failure may be injected into commit and
 * abort. */
class counting_engine : public mkv::engine {
  mkv::engine *const base_;

public:
  enum op {
    op_env_create,
    op_env_open,
    op_env_close,
    op_env_misc,
    op_txn_begin,
    op_txn_commit,
    op_txn_abort,
    op_txn_reset,
    op_txn_renew,
    op_dbi_open,
    op_dbi_close,
    op_dbi_misc,
    op_drop,
    op_get,
    op_put,
    op_del,
    op_cmp,
    op_cursor_open,
    op_cursor_close,
    op_cursor_get,
    op_cursor_put,
    op_cursor_del,
    op_cursor_count,
    op_count
  };

  std::atomic<unsigned> calls[op_count];
  /* Returned instead of calling the engine when nonzero. */
  std::atomic<int> fail_commit;
  std::atomic<int> fail_abort;

  explicit counting_engine(mkv::engine *base = mkv::default_engine());
  ~counting_engine() override;

  unsigned count(op which) const { return calls[which].load(); }
  unsigned total() const;
  void reset_counters();

  int env_create(mkv::engine_env **penv) override;
  int env_open(mkv::engine_env *env, const char *path, unsigned flags,
               mode_t mode) override;
  int env_close(mkv::engine_env *env) override;
  int env_sync(mkv::engine_env *env, bool force) override;
  int env_copy(mkv::engine_env *env, const char *path,
               unsigned flags) override;
  int env_copy2fd(mkv::engine_env *env, int fd, unsigned flags) override;
  int env_set_flags(mkv::engine_env *env, unsigned flags,
                    bool onoff) override;
  int env_get_flags(mkv::engine_env *env, unsigned *flags) override;
  int env_set_mapsize(mkv::engine_env *env, size_t size) override;
  int env_set_maxreaders(mkv::engine_env *env, unsigned readers) override;
  int env_get_maxreaders(mkv::engine_env *env, unsigned *readers) override;
  int env_set_maxdbs(mkv::engine_env *env, unsigned dbs) override;
  int env_get_maxdbs(mkv::engine_env *env, unsigned *dbs) override;
  int env_get_maxkeysize(mkv::engine_env *env, unsigned db_flags,
                         size_t *size) override;
  int env_get_fd(mkv::engine_env *env, int *fd) override;
  int env_stat(mkv::engine_env *env, mkv_stat *stat) override;
  int env_info(mkv::engine_env *env, mkv_envinfo *info) override;
  int reader_check(mkv::engine_env *env, int *dead) override;

  int txn_begin(mkv::engine_env *env, mkv::engine_txn *parent, unsigned flags,
                mkv::engine_txn **ptxn) override;
  int txn_commit(mkv::engine_txn *txn) override;
  int txn_abort(mkv::engine_txn *txn) override;
  int txn_reset(mkv::engine_txn *txn) override;
  int txn_renew(mkv::engine_txn *txn) override;

  int dbi_open(mkv::engine_txn *txn, const char *name, unsigned flags,
               mkv::engine_dbi *dbi) override;
  int dbi_close(mkv::engine_env *env, mkv::engine_dbi dbi) override;
  int dbi_stat(mkv::engine_txn *txn, mkv::engine_dbi dbi,
               mkv_stat *stat) override;
  int dbi_flags(mkv::engine_txn *txn, mkv::engine_dbi dbi,
                unsigned *flags) override;
  int drop(mkv::engine_txn *txn, mkv::engine_dbi dbi, bool del) override;

  int get(mkv::engine_txn *txn, mkv::engine_dbi dbi, const mkv::slice &key,
          mkv::slice *value) override;
  int put(mkv::engine_txn *txn, mkv::engine_dbi dbi, const mkv::slice &key,
          const mkv::slice &value, unsigned flags) override;
  int del(mkv::engine_txn *txn, mkv::engine_dbi dbi, const mkv::slice &key,
          const mkv::slice *value) override;
  int cmp(mkv::engine_txn *txn, mkv::engine_dbi dbi, const mkv::slice &a,
          const mkv::slice &b) override;

  int cursor_open(mkv::engine_txn *txn, mkv::engine_dbi dbi,
                  mkv::engine_cursor **pcursor) override;
  void cursor_close(mkv::engine_cursor *cursor) override;
  int cursor_get(mkv::engine_cursor *cursor, mkv::slice *key,
                 mkv::slice *value, mkv_cursor_op op) override;
  int cursor_put(mkv::engine_cursor *cursor, const mkv::slice &key,
                 const mkv::slice &value, unsigned flags) override;
  int cursor_del(mkv::engine_cursor *cursor, unsigned flags) override;
  int cursor_count(mkv::engine_cursor *cursor, size_t *count) override;
};
