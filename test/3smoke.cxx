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

#include "kv_test.h"
#include "tools.hpp"

#include <endian.h>
#include <map>

class Smoke : public EnvFixture {
protected:
  void SetUp() override {
    EnvFixture::SetUp();
    ASSERT_NO_FATAL_FAILURE(open_env());
  }
};

TEST_F(Smoke, RoundTrip) {
  mkv::db_handle table = open_table(env, "plain");
  ASSERT_TRUE(table.valid());
  EXPECT_TRUE(table.is_owner());
  EXPECT_FALSE(table.is_dupsort());

  {
    mkv::transaction txn = begin_write(env);
    mkv::writable_database db = txn.bind(table);
    EXPECT_EQ(MKV_NOTFOUND, db.get<std::string>("key").err);
    ASSERT_EQ(MKV_SUCCESS, db.set("key", "first"));
    ASSERT_EQ(MKV_SUCCESS, db.set("key", "second"));
    /* own writes are visible before commit */
    EXPECT_EQ("second", db.get<std::string>("key").value);
    ASSERT_EQ(MKV_SUCCESS, db.set(uint64_t(7), std::string("seven")));
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }

  mkv::readonly_transaction reader = begin_read(env);
  mkv::database db = reader.bind(table);
  mkv::result<std::string> value = db.get<std::string>("key");
  ASSERT_EQ(MKV_SUCCESS, value.err);
  EXPECT_EQ("second", value.value);
  EXPECT_EQ("seven", db.get<std::string>(uint64_t(7)).value);

  mkv::result<mkv_stat> stat = db.stat();
  ASSERT_EQ(MKV_SUCCESS, stat.err);
  EXPECT_EQ(2u, stat.value.entries);
}

TEST_F(Smoke, PutFlags) {
  mkv::db_handle table = open_table(env, "plain");
  mkv::transaction txn = begin_write(env);
  mkv::writable_database db = txn.bind(table);

  EXPECT_EQ(MKV_NOTFOUND, db.put("key", "value", mkv_current));
  ASSERT_EQ(MKV_SUCCESS, db.put("key", "value", mkv_nooverwrite));
  EXPECT_EQ(MKV_KEYEXIST, db.put("key", "other", mkv_nooverwrite));
  EXPECT_EQ("value", db.get<std::string>("key").value);
  ASSERT_EQ(MKV_SUCCESS, db.put("key", "other", mkv_current));
  EXPECT_EQ("other", db.get<std::string>("key").value);
  ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
}

TEST_F(Smoke, Duplicates) {
  mkv::db_handle table = open_table(env, "dups", mkv_dupsort);
  ASSERT_TRUE(table.valid());
  EXPECT_TRUE(table.is_dupsort());

  mkv::transaction txn = begin_write(env);
  mkv::writable_database db = txn.bind(table);
  ASSERT_EQ(MKV_SUCCESS, db.set("key", "beta"));
  ASSERT_EQ(MKV_SUCCESS, db.set("key", "alpha"));
  EXPECT_EQ(MKV_KEYEXIST, db.put("key", "beta", mkv_nodupdata));

  /* values of a key come in sorted order, get() yields the first one */
  EXPECT_EQ("alpha", db.get<std::string>("key").value);
  EXPECT_EQ(2u, db.stat().value.entries);

  ASSERT_EQ(MKV_SUCCESS, db.del_exact("key", "alpha"));
  EXPECT_EQ("beta", db.get<std::string>("key").value);
  EXPECT_EQ(MKV_NOTFOUND, db.del_exact("key", "alpha"));

  ASSERT_EQ(MKV_SUCCESS, db.set("key", "gamma"));
  ASSERT_EQ(MKV_SUCCESS, db.del("key"));
  EXPECT_EQ(MKV_NOTFOUND, db.get<std::string>("key").err);
  EXPECT_EQ(MKV_NOTFOUND, db.del("key"));
  ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
}

TEST_F(Smoke, NameCache) {
  mkv::db_handle first = open_table(env, "table");
  ASSERT_TRUE(first.valid());
  EXPECT_TRUE(first.is_owner());

  /* the second lookup is served by the cache with a non-owning copy */
  mkv::result<mkv::db_handle> second = env.get_or_create_database("table");
  ASSERT_EQ(MKV_SUCCESS, second.err);
  EXPECT_FALSE(second.value.is_owner());
  EXPECT_EQ(first.dbi(), second.value.dbi());
  EXPECT_TRUE(first.same_table(second.value));
  EXPECT_EQ(MKV_EPERM, env.close_database(second.value));

  mkv::result<mkv::db_handle> existing = env.get_database("table");
  ASSERT_EQ(MKV_SUCCESS, existing.err);
  EXPECT_TRUE(first.same_table(existing.value));

  /* flags must agree with the ones the table was opened with */
  EXPECT_EQ(MKV_INCOMPATIBLE,
            env.get_or_create_database("table", mkv_dupsort).err);

  EXPECT_EQ(MKV_NOTFOUND, env.get_database("missing").err);
  EXPECT_EQ(MKV_EINVAL, env.get_database(nullptr).err);

  mkv::db_handle copy = first.clone();
  EXPECT_FALSE(copy.is_owner());
  EXPECT_TRUE(copy.same_table(first));

  mkv::db_handle moved = std::move(first);
  EXPECT_TRUE(moved.is_owner());
  EXPECT_FALSE(first.is_owner());

  ASSERT_EQ(MKV_SUCCESS, env.close_database(moved));
  EXPECT_FALSE(moved.valid());

  /* reopening after close goes to the engine again */
  mkv::db_handle again = open_table(env, "table");
  ASSERT_TRUE(again.valid());
  EXPECT_TRUE(again.is_owner());
}

TEST_F(Smoke, DefaultDatabase) {
  mkv::result<mkv::db_handle> main = env.get_default_database();
  ASSERT_EQ(MKV_SUCCESS, main.err);
  EXPECT_TRUE(main.value.valid());

  mkv::result<mkv::db_handle> again = env.get_default_database();
  ASSERT_EQ(MKV_SUCCESS, again.err);
  EXPECT_TRUE(main.value.same_table(again.value));
}

TEST_F(Smoke, ClearAndDrop) {
  mkv::db_handle table = open_table(env, "table");
  {
    mkv::transaction txn = begin_write(env);
    mkv::writable_database db = txn.bind(table);
    for (uint64_t i = 0; i < 42; ++i)
      ASSERT_EQ(MKV_SUCCESS, db.set(i, i * i));
    EXPECT_EQ(42u, db.stat().value.entries);
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }

  {
    mkv::transaction txn = begin_write(env);
    mkv::writable_database db = txn.bind(table);
    ASSERT_EQ(MKV_SUCCESS, db.clear());
    EXPECT_EQ(0u, db.stat().value.entries);
    EXPECT_EQ(MKV_NOTFOUND, db.get<uint64_t>(uint64_t(1)).err);
    ASSERT_EQ(MKV_SUCCESS, db.set(uint64_t(1), uint64_t(1)));
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }

  {
    mkv::transaction txn = begin_write(env);
    ASSERT_EQ(MKV_SUCCESS, txn.bind(table).del_db());
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }

  /* the table is gone together with its cache entry */
  EXPECT_EQ(MKV_NOTFOUND, env.get_database("table").err);
  mkv::db_handle fresh = open_table(env, "table");
  ASSERT_TRUE(fresh.valid());
  EXPECT_TRUE(fresh.is_owner());

  mkv::readonly_transaction reader = begin_read(env);
  EXPECT_EQ(0u, reader.bind(fresh).stat().value.entries);
}

TEST_F(Smoke, ReadOnlyWrites) {
  mkv::db_handle table = open_table(env, "table");
  ASSERT_EQ(MKV_SUCCESS, env.close());

  mkv::env_options options;
  options.flags = mkv_readonly;
  options.max_databases = 4;
  mkv::result<mkv::environment> opened =
      mkv::environment::create_or_open(path.c_str(), options);
  ASSERT_EQ(MKV_SUCCESS, opened.err);
  env = std::move(opened.value);

  mkv::result<mkv::db_handle> existing = env.get_database("table");
  ASSERT_EQ(MKV_SUCCESS, existing.err);
  /* a read-only environment never creates a table */
  EXPECT_NE(MKV_SUCCESS, env.get_or_create_database("absent").err);
  EXPECT_NE(MKV_SUCCESS, env.new_transaction().err);
}

//----------------------------------------------------------------------------

/* A random mix of writes checked against std::map, for plain and dupsort
 * tables. */
class SmokeWorkload : public EnvFixture,
                      public ::testing::WithParamInterface<unsigned> {
protected:
  bool skipped;

  void SetUp() override {
    EnvFixture::SetUp();
    skipped = GTEST_IS_EXECUTION_TIMEOUT();
    if (!skipped)
      ASSERT_NO_FATAL_FAILURE(open_env());
  }
};

TEST_P(SmokeWorkload, AgainstModel) {
  if (skipped)
    return;

  const unsigned flags = GetParam();
  mkv::db_handle table = open_table(env, "workload", flags);
  ASSERT_TRUE(table.valid());

  std::multimap<uint32_t, uint32_t> model;
  srand(42);
  for (int round = 0; round < 16; ++round) {
    SCOPED_TRACE("round " + std::to_string(round));
    mkv::transaction txn = begin_write(env);
    mkv::writable_database db = txn.bind(table);
    for (int i = 0; i < 64; ++i) {
      /* big-endian keys keep the byte order equal to the numeric one */
      const uint32_t key = htobe32(uint32_t(rand() % 97));
      const uint32_t value = uint32_t(rand() % 5);
      if (rand() % 4 == 0) {
        const int rc = db.del(key);
        EXPECT_EQ(model.count(key) ? MKV_SUCCESS : MKV_NOTFOUND, rc);
        model.erase(key);
        continue;
      }
      ASSERT_EQ(MKV_SUCCESS, db.set(key, value));
      if (!(flags & mkv_dupsort)) {
        model.erase(key);
        model.emplace(key, value);
        continue;
      }
      bool present = false;
      auto span = model.equal_range(key);
      for (auto it = span.first; it != span.second; ++it)
        present = present || it->second == value;
      if (!present)
        model.emplace(key, value);
    }
    ASSERT_EQ(MKV_SUCCESS, std::move(txn).commit());
  }

  mkv::readonly_transaction reader = begin_read(env);
  mkv::database db = reader.bind(table);
  EXPECT_EQ(model.size(), db.stat().value.entries);

  std::vector<uint32_t> distinct;
  for (auto it = model.begin(); it != model.end();
       it = model.upper_bound(it->first))
    distinct.push_back(it->first);
  std::sort(distinct.begin(), distinct.end(), [](uint32_t a, uint32_t b) {
    return be32toh(a) < be32toh(b);
  });
  EXPECT_EQ(distinct, collect_keys<uint32_t>(db.iter()));

  for (uint32_t key : distinct) {
    std::vector<uint32_t> expected;
    auto span = model.equal_range(key);
    for (auto it = span.first; it != span.second; ++it)
      expected.push_back(it->second);
    /* with dupsort the values of a key come out sorted by their bytes */
    std::sort(expected.begin(), expected.end(), [](uint32_t a, uint32_t b) {
      return memcmp(&a, &b, sizeof(a)) < 0;
    });
    EXPECT_EQ(expected, collect_values<uint32_t>(db.item_iter(key)));
  }
}

#ifdef INSTANTIATE_TEST_SUITE_P
INSTANTIATE_TEST_SUITE_P(Combine, SmokeWorkload,
                         ::testing::Values(unsigned(mkv_db_defaults),
                                           unsigned(mkv_dupsort)));
#else
INSTANTIATE_TEST_CASE_P(Combine, SmokeWorkload,
                        ::testing::Values(unsigned(mkv_db_defaults),
                                          unsigned(mkv_dupsort)));
#endif

int main(int argc, char **argv) { return test_main(argc, argv); }
