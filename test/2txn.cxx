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

#include "counting_engine.hpp"
#include "kv_test.h"
#include "tools.hpp"

/* Outlives the fixtures' environments. */
static counting_engine engine;

class Transaction : public EnvFixture {
protected:
  mkv::db_handle table;

  void SetUp() override {
    EnvFixture::SetUp();
    engine.reset_counters();
    ASSERT_NO_FATAL_FAILURE(open_env(mkv_env_defaults, &engine));
    table = open_table(env, "table");
    ASSERT_TRUE(table.valid());
  }

  void TearDown() override {
    table = mkv::db_handle();
    EnvFixture::TearDown();
  }
};

TEST_F(Transaction, CommitInvalidates) {
  mkv::transaction txn = begin_write(env);
  ASSERT_EQ(mkv::txn_state::normal, txn.state());
  EXPECT_FALSE(txn.is_readonly());

  mkv::writable_database db = txn.bind(table);
  ASSERT_EQ(MKV_SUCCESS, db.set(uint64_t(1), uint64_t(42)));
  ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  EXPECT_EQ(mkv::txn_state::invalid, txn.state());

  /* Every guarded operation fails locally, without a single engine call. */
  engine.reset_counters();
  EXPECT_EQ(MKV_STATE_MISMATCH, db.get<uint64_t>(uint64_t(1)).err);
  EXPECT_EQ(MKV_STATE_MISMATCH, db.set(uint64_t(1), uint64_t(43)));
  EXPECT_EQ(MKV_STATE_MISMATCH, db.del(uint64_t(1)));
  EXPECT_EQ(MKV_STATE_MISMATCH, db.clear());
  EXPECT_EQ(MKV_STATE_MISMATCH, db.stat().err);
  EXPECT_EQ(MKV_STATE_MISMATCH, db.new_cursor().err);
  EXPECT_EQ(MKV_STATE_MISMATCH, db.iter().err);
  EXPECT_EQ(MKV_STATE_MISMATCH, std::move(txn).commit());
  EXPECT_EQ(MKV_STATE_MISMATCH, txn.new_child().err);
  EXPECT_EQ(0u, engine.total());

  /* abort of a finished transaction is a harmless no-op */
  EXPECT_EQ(MKV_SUCCESS, std::move(txn).abort());
  EXPECT_EQ(0u, engine.total());

  mkv::readonly_transaction reader = begin_read(env);
  mkv::result<uint64_t> value = reader.bind(table).get<uint64_t>(uint64_t(1));
  ASSERT_EQ(MKV_SUCCESS, value.err);
  EXPECT_EQ(42u, value.value);
}

TEST_F(Transaction, AbortDiscards) {
  {
    mkv::transaction txn = begin_write(env);
    ASSERT_EQ(MKV_SUCCESS, txn.bind(table).set("key", "value"));
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).abort());
    EXPECT_EQ(mkv::txn_state::invalid, txn.state());
    EXPECT_EQ(1u, engine.count(counting_engine::op_txn_abort));
  }

  {
    mkv::transaction txn = begin_write(env);
    ASSERT_EQ(MKV_SUCCESS, txn.bind(table).set("key", "value"));
    /* an unresolved transaction is rolled back on destruction */
  }
  EXPECT_EQ(2u, engine.count(counting_engine::op_txn_abort));

  mkv::readonly_transaction reader = begin_read(env);
  EXPECT_EQ(MKV_NOTFOUND, reader.bind(table).get<std::string>("key").err);
}

TEST_F(Transaction, ReaderResetRenew) {
  mkv::readonly_transaction reader = begin_read(env);
  EXPECT_TRUE(reader.is_readonly());
  mkv::database db = reader.bind(table);

  /* renew is valid only for a released transaction */
  engine.reset_counters();
  EXPECT_EQ(MKV_STATE_MISMATCH, reader.renew());
  EXPECT_EQ(0u, engine.total());

  ASSERT_EQ(MKV_SUCCESS, reader.reset());
  EXPECT_EQ(mkv::txn_state::released, reader.state());
  EXPECT_EQ(1u, engine.count(counting_engine::op_txn_reset));

  engine.reset_counters();
  EXPECT_EQ(MKV_STATE_MISMATCH, reader.reset());
  EXPECT_EQ(MKV_STATE_MISMATCH, db.get<std::string>("key").err);
  EXPECT_EQ(MKV_STATE_MISMATCH, db.new_cursor().err);
  EXPECT_EQ(0u, engine.total());

  /* the new snapshot sees data committed in between */
  {
    mkv::transaction txn = begin_write(env);
    ASSERT_EQ(MKV_SUCCESS, txn.bind(table).set("key", "value"));
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }

  ASSERT_EQ(MKV_SUCCESS, reader.renew());
  EXPECT_EQ(mkv::txn_state::normal, reader.state());
  mkv::result<std::string> value = db.get<std::string>("key");
  ASSERT_EQ(MKV_SUCCESS, value.err);
  EXPECT_EQ("value", value.value);
}

TEST_F(Transaction, ReaderCommitReleases) {
  mkv::readonly_transaction reader = begin_read(env);
  ASSERT_EQ(MKV_SUCCESS, reader.commit());
  EXPECT_EQ(mkv::txn_state::released, reader.state());
  EXPECT_EQ(0u, engine.count(counting_engine::op_txn_commit));

  EXPECT_EQ(MKV_STATE_MISMATCH, reader.commit());
  ASSERT_EQ(MKV_SUCCESS, reader.renew());
  EXPECT_EQ(mkv::txn_state::normal, reader.state());

  ASSERT_EQ(MKV_SUCCESS, std::move(reader).abort());
  EXPECT_EQ(mkv::txn_state::invalid, reader.state());
  EXPECT_EQ(MKV_STATE_MISMATCH, reader.renew());
}

TEST_F(Transaction, Nested) {
  mkv::transaction parent = begin_write(env);
  ASSERT_EQ(MKV_SUCCESS, parent.bind(table).set("outer", "1"));

  {
    mkv::result<mkv::transaction> child = parent.new_child();
    ASSERT_EQ(MKV_SUCCESS, child.err);
    /* one nested transaction at a time */
    EXPECT_EQ(MKV_STATE_MISMATCH, parent.new_child().err);
    /* the parent can't be committed under an unresolved child */
    EXPECT_EQ(MKV_STATE_MISMATCH, std::move(parent).commit());
    EXPECT_EQ(mkv::txn_state::normal, parent.state());

    ASSERT_EQ(MKV_SUCCESS, child.value.bind(table).set("inner", "2"));
    ASSERT_EQ(MKV_SUCCESS, std::move(child.value).commit());
  }

  {
    mkv::result<mkv::transaction> child = parent.new_child();
    ASSERT_EQ(MKV_SUCCESS, child.err);
    ASSERT_EQ(MKV_SUCCESS, child.value.bind(table).set("dropped", "3"));
    ASSERT_EQ(MKV_SUCCESS, std::move(child.value).abort());
  }

  mkv::database db = parent.bind(table);
  EXPECT_EQ(MKV_SUCCESS, db.get<std::string>("inner").err);
  EXPECT_EQ(MKV_NOTFOUND, db.get<std::string>("dropped").err);
  ASSERT_EQ(MKV_SUCCESS, std::move(parent).commit());

  mkv::readonly_transaction reader = begin_read(env);
  mkv::database view = reader.bind(table);
  EXPECT_EQ("1", view.get<std::string>("outer").value);
  EXPECT_EQ("2", view.get<std::string>("inner").value);
  EXPECT_EQ(MKV_NOTFOUND, view.get<std::string>("dropped").err);
}

TEST_F(Transaction, ParentAbortInvalidatesChild) {
  mkv::transaction parent = begin_write(env);
  mkv::result<mkv::transaction> child = parent.new_child();
  ASSERT_EQ(MKV_SUCCESS, child.err);
  ASSERT_EQ(MKV_SUCCESS, child.value.bind(table).set("key", "value"));

  ASSERT_EQ(MKV_SUCCESS, std::move(parent).abort());
  EXPECT_EQ(mkv::txn_state::invalid, parent.state());
  EXPECT_EQ(mkv::txn_state::invalid, child.value.state());

  engine.reset_counters();
  EXPECT_EQ(MKV_STATE_MISMATCH, child.value.bind(table).set("key", "again"));
  EXPECT_EQ(MKV_STATE_MISMATCH, std::move(child.value).commit());
  EXPECT_EQ(0u, engine.total());
}

TEST_F(Transaction, FailedCommit) {
  mkv::transaction txn = begin_write(env);
  ASSERT_EQ(MKV_SUCCESS, txn.bind(table).set("key", "value"));

  engine.fail_commit = MKV_MAP_FULL;
  EXPECT_EQ(MKV_MAP_FULL, std::move(txn).commit());
  /* the transaction is gone whatever the outcome */
  EXPECT_EQ(mkv::txn_state::invalid, txn.state());
  EXPECT_EQ(MKV_SUCCESS, env.close());
}

#if !MKV_ENABLE_ABORT_ON_PANIC
TEST_F(Transaction, FailedRollback) {
  mkv::transaction txn = begin_write(env);
  ASSERT_EQ(MKV_SUCCESS, txn.bind(table).set("key", "value"));

  engine.fail_abort = MKV_PROBLEM;
  const int rc = std::move(txn).abort();
  EXPECT_EQ(MKV_WANNA_DIE, rc);
  EXPECT_EQ(mkv::error_kind::panic, mkv::classify(rc));
  EXPECT_EQ(mkv::txn_state::invalid, txn.state());
}
#endif /* !MKV_ENABLE_ABORT_ON_PANIC */

TEST_F(Transaction, ViewsOutliveTransaction) {
  mkv::database db;
  mkv::cursor cursor;
  {
    mkv::readonly_transaction reader = begin_read(env);
    db = reader.bind(table);
    mkv::result<mkv::cursor> opened = db.new_cursor();
    ASSERT_EQ(MKV_SUCCESS, opened.err);
    cursor = std::move(opened.value);
    EXPECT_EQ(MKV_NOTFOUND, db.get<std::string>("key").err);
  }

  /* the reader is gone, its views fail locally */
  engine.reset_counters();
  EXPECT_EQ(MKV_STATE_MISMATCH, db.get<std::string>("key").err);
  EXPECT_EQ(MKV_STATE_MISMATCH, db.stat().err);
  EXPECT_EQ(MKV_STATE_MISMATCH, db.iter().err);
  EXPECT_EQ(MKV_STATE_MISMATCH, cursor.to_first());
  EXPECT_EQ(MKV_STATE_MISMATCH, cursor.get_key<std::string>().err);
  EXPECT_EQ(0u, engine.total());
  EXPECT_EQ(MKV_SUCCESS, cursor.close());
  EXPECT_EQ(1u, engine.count(counting_engine::op_cursor_close));

  mkv::writable_database writable;
  {
    mkv::transaction txn = begin_write(env);
    writable = txn.bind(table);
    const mkv::writable_database copy = writable;
    ASSERT_EQ(MKV_SUCCESS, writable.set("key", "value"));
    EXPECT_EQ("value", copy.get<std::string>("key").value);
  }
  engine.reset_counters();
  EXPECT_EQ(MKV_STATE_MISMATCH, writable.set("key", "again"));
  EXPECT_EQ(MKV_STATE_MISMATCH, writable.del("key"));
  EXPECT_EQ(0u, engine.total());

  /* the unresolved write was rolled back */
  mkv::readonly_transaction reader = begin_read(env);
  EXPECT_EQ(MKV_NOTFOUND, reader.bind(table).get<std::string>("key").err);
}

TEST_F(Transaction, EnvironmentOutlivedByReader) {
  {
    mkv::transaction txn = begin_write(env);
    ASSERT_EQ(MKV_SUCCESS, txn.bind(table).set("key", "value"));
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }
  mkv::result<mkv::readonly_transaction> reader = env.get_reader();
  ASSERT_EQ(MKV_SUCCESS, reader.err);

  engine.reset_counters();
  env = mkv::environment();
  EXPECT_EQ(mkv::env_state::closed, env.state());
  /* the engine environment stays open while the reader needs it */
  EXPECT_EQ(0u, engine.count(counting_engine::op_env_close));

  {
    mkv::database db = reader.value.bind(table);
    EXPECT_EQ("value", db.get<std::string>("key").value);

    reader.value = mkv::readonly_transaction();
    EXPECT_EQ(1u, engine.count(counting_engine::op_txn_abort));
    EXPECT_EQ(MKV_STATE_MISMATCH, db.get<std::string>("key").err);
    EXPECT_EQ(0u, engine.count(counting_engine::op_env_close));
  }
  /* and is closed along with the last reference */
  EXPECT_EQ(1u, engine.count(counting_engine::op_env_close));
}

TEST_F(Transaction, EnvironmentDroppedAfterTransactions) {
  mkv::database db;
  {
    mkv::readonly_transaction reader = begin_read(env);
    db = reader.bind(table);
  }

  /* a stale view does not hold the engine environment open */
  engine.reset_counters();
  env = mkv::environment();
  EXPECT_EQ(1u, engine.count(counting_engine::op_env_close));
  EXPECT_EQ(MKV_STATE_MISMATCH, db.get<std::string>("key").err);
  EXPECT_EQ(1u, engine.total());
}

TEST_F(Transaction, ForeignHandle) {
  const std::string other_path = test_db_path("foreign");
  mkv::env_options options;
  options.max_databases = 4;
  mkv::result<mkv::environment> other =
      mkv::environment::create_or_open(other_path.c_str(), options);
  ASSERT_EQ(MKV_SUCCESS, other.err);
  mkv::db_handle alien = open_table(other.value, "table");
  ASSERT_TRUE(alien.valid());

  {
    mkv::transaction txn = begin_write(env);
    engine.reset_counters();
    EXPECT_EQ(MKV_FOREIGN_HANDLE, txn.bind(alien).set("key", "value"));
    EXPECT_EQ(MKV_FOREIGN_HANDLE, txn.bind(alien).get<std::string>("key").err);
    EXPECT_EQ(MKV_BAD_DBI, txn.bind(mkv::db_handle()).del("key"));
    EXPECT_EQ(0u, engine.count(counting_engine::op_put));
    EXPECT_EQ(0u, engine.count(counting_engine::op_get));
    EXPECT_EQ(0u, engine.count(counting_engine::op_del));
  }

  EXPECT_EQ(MKV_FOREIGN_HANDLE, env.close_database(alien));
  alien = mkv::db_handle();
  other.value = mkv::environment();
  EXPECT_EQ(MKV_SUCCESS, test_db_remove(other_path));
}

int main(int argc, char **argv) { return test_main(argc, argv); }
