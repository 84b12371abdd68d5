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

/*
 * libmkv = { Memory-mapped Key-Value }
 *
 * Ownership-typed binding for an embedded, memory-mapped, transactional
 * key-value engine (libmdbx): environments with a cache of named tables,
 * transactions guarded by a local state machine, cursors and range iterators
 * over borrowed (zero-copy) views of the engine's memory.
 */

#pragma once
#ifndef MKV_KV_H
#define MKV_KV_H

#define MKV_VERSION_MAJOR 0
#define MKV_VERSION_MINOR 2

#include "mkv/config.h"
#include "mkv/defs.h"

#if defined(mkv_EXPORTS)
#define MKV_API __dll_export
#elif LIBMKV_STATIC
#define MKV_API
#else
#define MKV_API __dll_import
#endif /* mkv_EXPORTS */

#include <errno.h>  // for error codes
#include <stddef.h> // for size_t
#include <stdint.h> // for uint64_t
#include <string.h> // for strlen(), memcpy()

#if defined(HAVE_SYS_STAT_H) || !defined(_WIN32)
#include <sys/stat.h> // for mode_t
#elif !defined(__mode_t_defined)
typedef unsigned short mode_t;
#endif

#include <iosfwd>      // for std::ostream
#include <iterator>    // for std::input_iterator_tag
#include <string>      // for std::string
#include <type_traits> // for std::enable_if<>
#include <utility>     // for std::pair<>, std::move()

//----------------------------------------------------------------------------
/* Opaque internals. */

typedef struct mkv_env mkv_env;
typedef struct mkv_txn mkv_txn;
typedef struct mkv_cursor mkv_cursor;

//----------------------------------------------------------------------------

/* Error codes.
 *
 * The library's own codes live above MKV_ERROR_BASE, native ones mirror
 * errno, and the engine's ones are passed through unchanged. */
enum mkv_error {
  MKV_SUCCESS = 0,
  MKV_OK = MKV_SUCCESS,
  MKV_RESULT_FALSE = MKV_SUCCESS,
  MKV_RESULT_TRUE = -1,
  MKV_ERROR_BASE = 4242,

  MKV_EOOPS
  /* Internal unexpected Oops */,
  MKV_STATE_MISMATCH
  /* Environment or transaction is in a state which forbids the operation */,
  MKV_INVALID_PATH
  /* Path is a file where a directory is required (or vice versa),
   * or the directory could not be created */,
  MKV_FOREIGN_HANDLE
  /* Database handle belongs to another environment */,
  MKV_WANNA_DIE
  /* Failure while transaction rollback */,
  MKV_ERROR_LAST,

  /**************************************** Native (system) error codes ***/
  MKV_EINVAL = EINVAL /* Invalid argument */,
  MKV_ENOMEM = ENOMEM /* Out of Memory */,
  MKV_EPERM = EPERM /* Operation not permitted */,
  MKV_EBUSY = EBUSY /* Device or resource busy */,
  MKV_ENOENT = ENOENT /* No such file or directory */,
  MKV_EACCESS = EACCES /* Permission denied */,
  MKV_ENOSYS = ENOSYS /* Function not implemented */,

  /*********************************************** Engine's error codes ***/
  MKV_KEYEXIST = -30799 /* key/data pair already exists */,
  MKV_NOTFOUND = -30798 /* key/data pair not found */,
  MKV_PAGE_NOTFOUND = -30797 /* wrong page address/number,
                              * this usually indicates corruption */,
  MKV_CORRUPTED = -30796 /* Located page was wrong data */,
  MKV_PANIC = -30795 /* Environment had fatal error,
                      * i.e. update of meta page failed and so on */,
  MKV_VERSION_MISMATCH = -30794 /* DB file version mismatch the engine */,
  MKV_INVALID = -30793 /* File is not a valid database file */,
  MKV_MAP_FULL = -30792 /* Environment mapsize reached */,
  MKV_DBS_FULL = -30791 /* Too many named databases (maxdbs reached) */,
  MKV_READERS_FULL = -30790 /* Too many readers (maxreaders reached) */,
  MKV_TXN_FULL = -30788 /* Transaction has too many dirty pages */,
  MKV_CURSOR_FULL = -30787 /* Cursor stack too deep (engine internal) */,
  MKV_PAGE_FULL = -30786 /* Page has not enough space (engine internal) */,
  MKV_UNABLE_EXTEND_MAPSIZE = -30785 /* Database contents grew beyond
                                      * environment mapsize */,
  MKV_INCOMPATIBLE = -30784 /* Environment or database is not compatible
                             * with the requested operation or flags */,
  MKV_BAD_RSLOT = -30783 /* Invalid reuse of reader locktable slot */,
  MKV_BAD_TXN = -30782 /* Transaction is not valid for requested operation */,
  MKV_BAD_VALSIZE = -30781 /* Invalid size or alignment of key or data */,
  MKV_BAD_DBI = -30780 /* The specified DBI-handle is invalid */,
  MKV_PROBLEM = -30779 /* Unexpected internal error,
                        * transaction should be aborted */,
  MKV_BUSY = -30778 /* Another write transaction is running */,
  MKV_EMULTIVAL = -30421 /* The key has more than one associated value */,
  MKV_EBADSIGN = -30420 /* Bad signature of a runtime object */,
  MKV_WANNA_RECOVERY = -30419 /* Database should be recovered */,
  MKV_EKEYMISMATCH = -30418 /* The given key value is mismatched to the
                             * current cursor position */,
  MKV_TOO_LARGE = -30417 /* Database is too large for the current system */,
  MKV_THREAD_MISMATCH = -30416 /* A thread has attempted to use a not owned
                                * object */
};

MKV_API const char *mkv_strerror(int errcode);
MKV_API const char *mkv_strerror_r(int errcode, char *buf, size_t buflen);

/* Hook for fatal failures, i.e. when a transaction rollback fails.
 *
 * Returning zero means "call abort()", otherwise the operation returns
 * MKV_WANNA_DIE. The default returns zero only when the library is built
 * with MKV_ENABLE_ABORT_ON_PANIC. On platforms with weak symbols an
 * application may override it. */
extern "C" MKV_API int mkv_panic(int errnum_initial, int errnum_fatal);

//----------------------------------------------------------------------------
/* Flags. */

/* Environment open flags. */
enum mkv_env_flags : unsigned {
  mkv_env_defaults = 0,
  /* The path names the data file itself rather than a directory. */
  mkv_nosubdir = 1u << 0,
  mkv_readonly = 1u << 1,
  mkv_exclusive = 1u << 2,
  mkv_accede = 1u << 3,
  mkv_writemap = 1u << 4,
  /* Don't tie reader slots to threads. */
  mkv_notls = 1u << 5,
  mkv_nordahead = 1u << 6,
  mkv_nomeminit = 1u << 7,
  mkv_coalesce = 1u << 8,
  mkv_liforeclaim = 1u << 9,
  mkv_nometasync = 1u << 10,
  mkv_safe_nosync = 1u << 11,
  mkv_utterly_nosync = 1u << 12
};

/* Table (named database) flags. */
enum mkv_db_flags : unsigned {
  mkv_db_defaults = 0,
  mkv_reversekey = 1u << 0,
  /* Multiple sorted values per key. */
  mkv_dupsort = 1u << 1,
  /* Native-endian 32/64-bit unsigned keys compared as integers. */
  mkv_integerkey = 1u << 2,
  mkv_dupfixed = 1u << 3,
  mkv_integerdup = 1u << 4,
  mkv_reversedup = 1u << 5,
  mkv_create = 1u << 6
};

/* Data and cursor write flags. */
enum mkv_put_flags : unsigned {
  mkv_upsert = 0,
  mkv_nooverwrite = 1u << 0,
  mkv_nodupdata = 1u << 1,
  mkv_current = 1u << 2,
  mkv_alldups = 1u << 3,
  mkv_append = 1u << 4,
  mkv_appenddup = 1u << 5
};

enum mkv_copy_flags : unsigned { mkv_copy_defaults = 0, mkv_copy_compact = 1 };

enum mkv_txn_flags : unsigned { mkv_txn_readwrite = 0, mkv_txn_readonly = 1 };

/* Positioning operations of a cursor. */
enum mkv_cursor_op {
  mkv_first,
  mkv_last,
  mkv_get_current,
  mkv_set_key,   /* exact key */
  mkv_set_range, /* first key >= given */
  mkv_get_both,  /* exact key and value */
  mkv_next,
  mkv_prev,
  mkv_next_nodup, /* next distinct key */
  mkv_prev_nodup, /* previous distinct key */
  mkv_next_dup,   /* next value of the current key */
  mkv_prev_dup,   /* previous value of the current key */
  mkv_first_dup,
  mkv_last_dup
};

enum mkv_log_level {
  mkv_log_trace,
  mkv_log_debug,
  mkv_log_info,
  mkv_log_warn,
  mkv_log_error,
  mkv_log_critical,
  mkv_log_off
};

//----------------------------------------------------------------------------
/* Statistics. */

typedef struct mkv_stat {
  unsigned psize /* page size */;
  unsigned depth /* height of the B-tree */;
  uint64_t branch_pages;
  uint64_t leaf_pages;
  uint64_t overflow_pages;
  uint64_t entries;
  uint64_t mod_txnid /* transaction ID of the last modification */;
} mkv_stat;

typedef struct mkv_envinfo {
  struct {
    uint64_t lower, upper, current, shrink, grow;
  } geo;
  uint64_t mapsize;
  uint64_t last_pgno;
  uint64_t recent_txnid;
  uint64_t latter_reader_txnid;
  uint64_t self_latter_reader_txnid;
  unsigned maxreaders;
  unsigned numreaders;
  unsigned dxb_pagesize;
  unsigned sys_pagesize;
} mkv_envinfo;

//----------------------------------------------------------------------------

namespace mkv {

class engine;

enum class env_state { created, opened, closed };
enum class txn_state { normal, released, invalid };

/* Closed taxonomy over error codes. */
enum class error_kind {
  success,
  not_found,
  key_exists,
  txn_full,
  cursor_full,
  page_full,
  corrupted,
  panic,
  invalid_path,
  state_error,
  custom
};

MKV_API error_kind classify(int errcode);

/* Route library (and optionally engine) diagnostics to the "mkv" spdlog
 * logger at the given level. The SPDLOG_LEVEL environment variable is
 * honored when the logger is first created. */
MKV_API void setup_debug(mkv_log_level level, bool trace_engine = false);

//----------------------------------------------------------------------------

/* Borrowed view of bytes. Read results point into the engine's memory map
 * and stay valid until the transaction ends or the table is modified. */
struct slice {
  const void *iov_base;
  size_t iov_len;

  constexpr slice() noexcept : iov_base(nullptr), iov_len(0) {}
  constexpr slice(const void *ptr, size_t bytes) noexcept
      : iov_base(ptr), iov_len(bytes) {}
  slice(const char *cstr) noexcept
      : iov_base(cstr), iov_len(cstr ? strlen(cstr) : 0) {}
  slice(const std::string &str) noexcept
      : iov_base(str.data()), iov_len(str.size()) {}

  const char *char_ptr() const noexcept {
    return static_cast<const char *>(iov_base);
  }
  size_t size() const noexcept { return iov_len; }
  bool empty() const noexcept { return iov_len == 0; }
  std::string string() const { return std::string(char_ptr(), iov_len); }

  bool operator==(const slice &other) const noexcept {
    return iov_len == other.iov_len &&
           (iov_len == 0 || memcmp(iov_base, other.iov_base, iov_len) == 0);
  }
  bool operator!=(const slice &other) const noexcept {
    return !(*this == other);
  }
};

inline slice as_slice(const slice &src) { return src; }
inline slice as_slice(const std::string &src) { return slice(src); }
inline slice as_slice(const char *src) { return slice(src); }
template <typename T>
inline typename std::enable_if<std::is_arithmetic<T>::value, slice>::type
as_slice(const T &src) {
  return slice(&src, sizeof(T));
}

inline int from_slice(const slice &src, slice &out) {
  out = src;
  return MKV_SUCCESS;
}
inline int from_slice(const slice &src, std::string &out) {
  out.assign(src.char_ptr(), src.iov_len);
  return MKV_SUCCESS;
}
template <typename T>
inline typename std::enable_if<std::is_arithmetic<T>::value, int>::type
from_slice(const slice &src, T &out) {
  if (unlikely(src.iov_len != sizeof(T)))
    return MKV_BAD_VALSIZE;
  memcpy(&out, src.iov_base, sizeof(T));
  return MKV_SUCCESS;
}

/* Error code with a value, which is meaningful only when err == MKV_OK. */
template <typename T> struct result {
  int err;
  T value;

  explicit result(int err) : err(err), value() {}
  result(int err, T &&value) : err(err), value(std::move(value)) {}
  result(int err, const T &value) : err(err), value(value) {}

  bool ok() const noexcept { return err == MKV_SUCCESS; }
  error_kind kind() const { return classify(err); }
};

template <typename T> inline result<T> decode(const slice &src) {
  T out = T();
  const int rc = from_slice(src, out);
  return (rc == MKV_SUCCESS) ? result<T>(rc, std::move(out)) : result<T>(rc);
}

//----------------------------------------------------------------------------

/* Reference to a named table of an environment.
 *
 * Handles are cheap values. Copies never own the underlying engine handle,
 * only the one returned by the environment when the table was first opened
 * (and the environment's own cache entry) may close it. A handle must not
 * be used with transactions of another environment, such attempts fail
 * with MKV_FOREIGN_HANDLE. */
class MKV_API db_handle {
  friend class environment;
  friend class database;

  const mkv_env *env_;
  unsigned dbi_;
  unsigned flags_;
  bool owner_;

  db_handle(const mkv_env *env, unsigned dbi, unsigned flags,
            bool owner) noexcept
      : env_(env), dbi_(dbi), flags_(flags), owner_(owner) {}

public:
  db_handle() noexcept : env_(nullptr), dbi_(0), flags_(0), owner_(false) {}
  db_handle(const db_handle &other) noexcept
      : env_(other.env_), dbi_(other.dbi_), flags_(other.flags_),
        owner_(false) {}
  db_handle(db_handle &&other) noexcept
      : env_(other.env_), dbi_(other.dbi_), flags_(other.flags_),
        owner_(other.owner_) {
    other.owner_ = false;
  }
  db_handle &operator=(const db_handle &other) noexcept {
    env_ = other.env_;
    dbi_ = other.dbi_;
    flags_ = other.flags_;
    owner_ = false;
    return *this;
  }
  db_handle &operator=(db_handle &&other) noexcept {
    env_ = other.env_;
    dbi_ = other.dbi_;
    flags_ = other.flags_;
    owner_ = other.owner_;
    other.owner_ = false;
    return *this;
  }

  unsigned dbi() const noexcept { return dbi_; }
  unsigned flags() const noexcept { return flags_; }
  bool is_owner() const noexcept { return owner_; }
  bool is_dupsort() const noexcept { return (flags_ & mkv_dupsort) != 0; }
  bool valid() const noexcept { return env_ != nullptr; }
  db_handle clone() const noexcept { return db_handle(*this); }
  bool same_table(const db_handle &other) const noexcept {
    return env_ == other.env_ && dbi_ == other.dbi_;
  }
};

//----------------------------------------------------------------------------

/* Positional cursor over one table within one transaction.
 *
 * A failed move reports the reason (MKV_NOTFOUND at either end) and there is
 * no distinguished "off the end" cursor object. Every operation fails with
 * MKV_STATE_MISMATCH once the transaction is not in the normal state, even
 * after the transaction object itself is gone. */
class MKV_API cursor {
  friend class database;

protected:
  mkv_cursor *cursor_;
  explicit cursor(mkv_cursor *handle) noexcept : cursor_(handle) {}

public:
  cursor() noexcept : cursor_(nullptr) {}
  cursor(const cursor &) = delete;
  cursor &operator=(const cursor &) = delete;
  cursor(cursor &&other) noexcept : cursor_(other.cursor_) {
    other.cursor_ = nullptr;
  }
  cursor &operator=(cursor &&other) noexcept;
  ~cursor();

  bool is_open() const noexcept { return cursor_ != nullptr; }
  int close();

  int move(mkv_cursor_op op);
  int seek(mkv_cursor_op op, const slice &key);
  int seek(mkv_cursor_op op, const slice &key, const slice &value);

  int to_first() { return move(mkv_first); }
  int to_last() { return move(mkv_last); }
  int to_next() { return move(mkv_next); }
  int to_prev() { return move(mkv_prev); }
  template <typename K> int to_key(const K &key) {
    return seek(mkv_set_key, as_slice(key));
  }
  template <typename K> int to_gte_key(const K &key) {
    return seek(mkv_set_range, as_slice(key));
  }
  template <typename K, typename V>
  int to_item(const K &key, const V &value) {
    return seek(mkv_get_both, as_slice(key), as_slice(value));
  }
  int to_next_key() { return move(mkv_next_nodup); }
  int to_prev_key() { return move(mkv_prev_nodup); }
  int to_next_key_item() { return move(mkv_next_dup); }
  int to_prev_key_item() { return move(mkv_prev_dup); }
  int to_first_key_item() { return move(mkv_first_dup); }
  int to_last_key_item() { return move(mkv_last_dup); }

  /* Current position without moving. */
  int fetch(slice *key, slice *value) const;
  template <typename K, typename V> result<std::pair<K, V>> get() const {
    slice key, value;
    int rc = fetch(&key, &value);
    if (unlikely(rc != MKV_SUCCESS))
      return result<std::pair<K, V>>(rc);
    std::pair<K, V> pair;
    rc = from_slice(key, pair.first);
    if (likely(rc == MKV_SUCCESS))
      rc = from_slice(value, pair.second);
    return (rc == MKV_SUCCESS) ? result<std::pair<K, V>>(rc, std::move(pair))
                               : result<std::pair<K, V>>(rc);
  }
  template <typename K> result<K> get_key() const {
    slice key;
    const int rc = fetch(&key, nullptr);
    return (rc == MKV_SUCCESS) ? decode<K>(key) : result<K>(rc);
  }
  template <typename V> result<V> get_value() const {
    slice value;
    const int rc = fetch(nullptr, &value);
    return (rc == MKV_SUCCESS) ? decode<V>(value) : result<V>(rc);
  }

  /* Number of values under the current key (always 1 without dupsort). */
  result<size_t> item_count() const;

  /* Orders the current key against the given one with the table's key
   * comparator: negative, zero or positive. */
  result<int> compare_key(const slice &other) const;
  template <typename K> result<int> cmp_key(const K &other) const {
    return compare_key(as_slice(other));
  }
};

class item_accessor;

class MKV_API writable_cursor : public cursor {
  friend class writable_database;
  explicit writable_cursor(mkv_cursor *handle) noexcept : cursor(handle) {}

  int replace_current(const slice &value);
  int add_to_current(const slice &value);

public:
  writable_cursor() noexcept {}
  writable_cursor(writable_cursor &&) = default;
  writable_cursor &operator=(writable_cursor &&) = default;

  int put(const slice &key, const slice &value, unsigned flags);
  template <typename K, typename V>
  int set(const K &key, const V &value, unsigned flags = mkv_upsert) {
    return put(as_slice(key), as_slice(value), flags);
  }

  /* Overwrites the value at the current position. A value longer than the
   * engine allows in place is the caller's problem. */
  template <typename V> int replace(const V &value) {
    return replace_current(as_slice(value));
  }

  /* Adds a value under the current key, failing with MKV_KEYEXIST when
   * exactly this key/value pair is already present. */
  template <typename V> int add_item(const V &value) {
    return add_to_current(as_slice(value));
  }
  template <typename V> int upsert(const V &value) { return add_item(value); }

  int del_single();
  int del_all();

  /* Consumes the cursor, see item_accessor. */
  template <typename K> item_accessor get_item(const K &key) &&;
};

/* All values of one key handled through a cursor, which the accessor owns
 * until into_cursor() gives it back. Every operation seeks the key first. */
class item_accessor {
  writable_cursor cursor_;
  std::string key_;

public:
  item_accessor(writable_cursor &&cursor, const slice &key)
      : cursor_(std::move(cursor)), key_(key.char_ptr(), key.size()) {}
  item_accessor(item_accessor &&) = default;
  item_accessor &operator=(item_accessor &&) = default;

  const std::string &key() const noexcept { return key_; }

  /* The first value in the table's order. */
  template <typename V> result<V> get() {
    const int rc = cursor_.to_key(slice(key_));
    return (rc == MKV_SUCCESS) ? cursor_.get_value<V>() : result<V>(rc);
  }

  template <typename V> int add(const V &value) {
    return cursor_.set(slice(key_), value);
  }

  template <typename V> int del(const V &value) {
    const int rc = cursor_.to_item(slice(key_), value);
    return (rc == MKV_SUCCESS) ? cursor_.del_single() : rc;
  }

  int del_all() {
    const int rc = cursor_.to_key(slice(key_));
    return (rc == MKV_SUCCESS) ? cursor_.del_all() : rc;
  }

  result<size_t> count() {
    const int rc = cursor_.to_key(slice(key_));
    return (rc == MKV_SUCCESS) ? cursor_.item_count() : result<size_t>(rc);
  }

  writable_cursor into_cursor() && { return std::move(cursor_); }
};

template <typename K>
item_accessor writable_cursor::get_item(const K &key) && {
  return item_accessor(std::move(*this), as_slice(key));
}

//----------------------------------------------------------------------------
/* Iteration. */

struct cursor_value {
  slice key;
  slice value;

  template <typename T> result<T> get_key() const { return decode<T>(key); }
  template <typename T> result<T> get_value() const {
    return decode<T>(value);
  }
};

/* Positioning policies, each is a pair of "seed" and "step" moves which
 * return false when the sequence is over. */
struct scan_all {
  bool init(cursor &c) const { return c.to_first() == MKV_SUCCESS; }
  bool next(cursor &c) const { return c.to_next_key() == MKV_SUCCESS; }
};

struct scan_from {
  std::string start;
  bool init(cursor &c) const {
    return c.to_gte_key(slice(start)) == MKV_SUCCESS;
  }
  bool next(cursor &c) const { return c.to_next_key() == MKV_SUCCESS; }
};

/* Keys strictly below the end. */
struct scan_to {
  std::string end;
  bool below_end(const cursor &c) const {
    const result<int> cmp = c.compare_key(slice(end));
    return cmp.ok() && cmp.value < 0;
  }
  bool init(cursor &c) const {
    return c.to_first() == MKV_SUCCESS && below_end(c);
  }
  bool next(cursor &c) const {
    return c.to_next_key() == MKV_SUCCESS && below_end(c);
  }
};

/* start <= key < end, or start <= key <= end with end_inclusive. */
struct scan_range {
  std::string start, end;
  bool end_inclusive;
  bool in_range(const cursor &c) const {
    const result<int> cmp = c.compare_key(slice(end));
    return cmp.ok() && (end_inclusive ? cmp.value <= 0 : cmp.value < 0);
  }
  bool init(cursor &c) const {
    return c.to_gte_key(slice(start)) == MKV_SUCCESS && in_range(c);
  }
  bool next(cursor &c) const {
    return c.to_next_key() == MKV_SUCCESS && in_range(c);
  }
};

/* All values of one key. */
struct scan_items {
  std::string key;
  bool init(cursor &c) const { return c.to_key(slice(key)) == MKV_SUCCESS; }
  bool next(cursor &c) const { return c.to_next_key_item() == MKV_SUCCESS; }
};

/* Single-pass, non-restartable sequence of borrowed key/value views produced
 * by driving a cursor with a policy. Ends at the first failed move. */
template <class Policy> class cursor_range {
  cursor cursor_;
  Policy policy_;
  cursor_value current_;
  bool has_data_;

  void load() {
    if (has_data_)
      has_data_ = cursor_.fetch(&current_.key, &current_.value) == MKV_SUCCESS;
  }

  void advance() {
    has_data_ = has_data_ && policy_.next(cursor_);
    load();
  }

public:
  class iterator {
    cursor_range *range_;

  public:
    typedef std::input_iterator_tag iterator_category;
    typedef cursor_value value_type;
    typedef ptrdiff_t difference_type;
    typedef const cursor_value *pointer;
    typedef const cursor_value &reference;

    explicit iterator(cursor_range *range = nullptr) : range_(range) {}
    reference operator*() const { return range_->current_; }
    pointer operator->() const { return &range_->current_; }
    iterator &operator++() {
      range_->advance();
      if (!range_->has_data_)
        range_ = nullptr;
      return *this;
    }
    bool operator==(const iterator &other) const {
      return range_ == other.range_;
    }
    bool operator!=(const iterator &other) const {
      return range_ != other.range_;
    }
  };

  cursor_range() : has_data_(false) {}
  cursor_range(cursor &&source, Policy policy)
      : cursor_(std::move(source)), policy_(std::move(policy)),
        has_data_(false) {
    has_data_ = policy_.init(cursor_);
    load();
  }
  cursor_range(cursor_range &&) = default;
  cursor_range &operator=(cursor_range &&) = default;

  iterator begin() { return iterator(has_data_ ? this : nullptr); }
  iterator end() { return iterator(); }
  bool empty() const { return !has_data_; }
};

//----------------------------------------------------------------------------

/* A table bound to a transaction for reading. A view keeps the state of its
 * transaction reachable, so once the transaction is finished or destroyed
 * every operation fails with MKV_STATE_MISMATCH. Values read through a
 * view are borrowed and die with the transaction. */
class MKV_API database {
  friend class transaction_base;

protected:
  mkv_txn *txn_;
  db_handle handle_;

  database(mkv_txn *txn, const db_handle &handle) noexcept;

  /* The transaction must be in the normal state and of the same
   * environment as the handle. */
  int validate(const char *op) const;
  int get_slice(const slice &key, slice *value) const;
  int open_cursor(mkv_cursor **pcursor) const;
  result<cursor_range<scan_from>> range_from(const slice &start) const;
  result<cursor_range<scan_to>> range_to(const slice &end) const;
  result<cursor_range<scan_range>> range_between(const slice &start,
                                                 const slice &end,
                                                 bool end_inclusive) const;
  result<cursor_range<scan_items>> range_items(const slice &key) const;

public:
  database() noexcept : txn_(nullptr) {}
  database(const database &other) noexcept;
  database(database &&other) noexcept
      : txn_(other.txn_), handle_(std::move(other.handle_)) {
    other.txn_ = nullptr;
  }
  database &operator=(const database &other) noexcept;
  database &operator=(database &&other) noexcept;
  ~database();

  const db_handle &handle() const noexcept { return handle_; }
  result<mkv_stat> stat() const;

  /* The first value of the key, or MKV_NOTFOUND. */
  template <typename T, typename K> result<T> get(const K &key) const {
    slice value;
    const int rc = get_slice(as_slice(key), &value);
    return (rc == MKV_SUCCESS) ? decode<T>(value) : result<T>(rc);
  }

  result<cursor> new_cursor() const;

  result<cursor_range<scan_all>> iter() const;

  /* Keys >= start. */
  template <typename K>
  result<cursor_range<scan_from>> keyrange_from(const K &start) const {
    return range_from(as_slice(start));
  }

  /* Keys < end. */
  template <typename K>
  result<cursor_range<scan_to>> keyrange_to(const K &end) const {
    return range_to(as_slice(end));
  }

  /* Keys in [start, end), the end key is excluded. */
  template <typename K>
  result<cursor_range<scan_range>> keyrange(const K &start,
                                            const K &end) const {
    return range_between(as_slice(start), as_slice(end), false);
  }

  /* Keys in [start, end], the end key is included. */
  template <typename K>
  result<cursor_range<scan_range>> keyrange_inclusive(const K &start,
                                                      const K &end) const {
    return range_between(as_slice(start), as_slice(end), true);
  }

  /* All values of the key. */
  template <typename K>
  result<cursor_range<scan_items>> item_iter(const K &key) const {
    return range_items(as_slice(key));
  }
};

class MKV_API writable_database : public database {
  friend class transaction;

  writable_database(mkv_txn *txn, const db_handle &handle) noexcept
      : database(txn, handle) {}

  int erase(const slice &key, const slice *value);

public:
  writable_database() noexcept {}

  int put(const slice &key, const slice &value, unsigned flags);

  /* Overwrites without dupsort, adds one more value with dupsort. */
  template <typename K, typename V> int set(const K &key, const V &value) {
    return put(as_slice(key), as_slice(value), mkv_upsert);
  }

  /* Removes all values of the key. */
  template <typename K> int del(const K &key) {
    return erase(as_slice(key), nullptr);
  }

  /* Removes only the value byte-equal to the given one. */
  template <typename K, typename V>
  int del_exact(const K &key, const V &value) {
    const slice exact = as_slice(value);
    return erase(as_slice(key), &exact);
  }

  /* Empties the table. */
  int clear();

  /* Destroys the table and forgets it in the environment's cache. */
  int del_db();

  result<writable_cursor> new_cursor() const;
};

//----------------------------------------------------------------------------

/* Common part of read-only and read-write transactions.
 *
 * A transaction exclusively owns its engine handle and is not shareable
 * between threads. Every operation checks the local state first and fails
 * with MKV_STATE_MISMATCH without touching the engine when the state does
 * not match. An unresolved transaction is aborted on destruction. */
class MKV_API transaction_base {
protected:
  mkv_txn *txn_;

  transaction_base() noexcept : txn_(nullptr) {}
  explicit transaction_base(mkv_txn *txn) noexcept : txn_(txn) {}
  transaction_base(transaction_base &&other) noexcept : txn_(other.txn_) {
    other.txn_ = nullptr;
  }
  transaction_base &operator=(transaction_base &&other) noexcept;
  ~transaction_base();

  int end(bool abort);
  database bind_ro(const db_handle &db) const noexcept {
    return database(txn_, db);
  }

public:
  transaction_base(const transaction_base &) = delete;
  transaction_base &operator=(const transaction_base &) = delete;

  txn_state state() const noexcept;
  bool is_readonly() const noexcept;
};

class MKV_API readonly_transaction : public transaction_base {
  friend class environment;
  explicit readonly_transaction(mkv_txn *txn) noexcept
      : transaction_base(txn) {}

public:
  readonly_transaction() noexcept {}
  readonly_transaction(readonly_transaction &&) = default;
  readonly_transaction &operator=(readonly_transaction &&) = default;

  database bind(const db_handle &db) const noexcept { return bind_ro(db); }

  /* Finishes the snapshot but keeps the handle, so the transaction moves to
   * the released state and may be renewed later. */
  int commit();
  int abort() && { return end(true); }

  /* normal -> released, the reader slot is given up. */
  int reset();
  /* released -> normal with a fresh snapshot. */
  int renew();
};

class MKV_API transaction : public transaction_base {
  friend class environment;
  explicit transaction(mkv_txn *txn) noexcept : transaction_base(txn) {}

public:
  transaction() noexcept {}
  transaction(transaction &&) = default;
  transaction &operator=(transaction &&) = default;

  writable_database bind(const db_handle &db) const noexcept {
    return writable_database(txn_, db);
  }

  /* Nested transaction, which must be resolved before this one. */
  result<transaction> new_child();

  /* Both consume the transaction: it is invalid afterwards, whatever the
   * outcome. */
  int commit() && { return end(false); }
  int abort() && { return end(true); }
};

//----------------------------------------------------------------------------

/* Parameters for environment::create_or_open(), zeroes mean "engine
 * default". */
struct env_options {
  unsigned flags;
  mode_t mode;
  size_t map_size;
  unsigned max_readers;
  unsigned max_databases;
  bool autocreate_dir;

  env_options()
      : flags(mkv_env_defaults), mode(0640), map_size(0), max_readers(0),
        max_databases(0), autocreate_dir(true) {}
};

/* Owner of an engine environment and the cache of its named tables.
 *
 * May be used from several threads at once to start transactions and to
 * open tables. When destroyed while transactions are still alive, the engine
 * environment is closed only after the last of them. Sizing is allowed only
 * before open(), while most other operations require an opened
 * environment. */
class MKV_API environment {
  mkv_env *env_;

  explicit environment(mkv_env *env) noexcept : env_(env) {}
  result<db_handle> open_database(const char *name, unsigned flags,
                                  bool create);

public:
  environment() noexcept : env_(nullptr) {}
  environment(const environment &) = delete;
  environment &operator=(const environment &) = delete;
  environment(environment &&other) noexcept : env_(other.env_) {
    other.env_ = nullptr;
  }
  environment &operator=(environment &&other) noexcept;
  ~environment();

  /* The engine must outlive the environment, nullptr means libmdbx. */
  static result<environment> create(engine *engine = nullptr);
  static result<environment> create_or_open(const char *path,
                                            const env_options &options,
                                            engine *engine = nullptr);

  env_state state() const noexcept;

  int set_map_size(size_t size);
  int set_max_readers(unsigned readers);
  int set_max_databases(unsigned count);

  /* Without mkv_nosubdir the path is a directory, which is created when
   * missing and autocreate_dir is set. On failure the engine environment is
   * released and the state becomes closed. */
  int open(const char *path, unsigned flags = mkv_env_defaults,
           mode_t mode = 0640, bool autocreate_dir = true);

  /* Closing twice is a no-op. Fails with MKV_EBUSY while any transaction
   * of the environment is alive. */
  int close();

  int sync(bool force = false);
  int copy_to_path(const char *path, unsigned flags = mkv_copy_defaults);
  int copy_to_fd(int fd, unsigned flags = mkv_copy_defaults);
  result<mkv_stat> stat() const;
  result<mkv_envinfo> info() const;
  result<int> reader_check();

  int set_flags(unsigned flags, bool onoff);
  result<unsigned> get_flags() const;
  result<size_t> get_map_size() const;
  result<unsigned> get_max_readers() const;
  result<unsigned> get_max_databases() const;
  result<size_t> get_max_keysize(unsigned db_flags = mkv_db_defaults) const;
  result<int> get_fd() const;

  /* Named tables. A cache hit returns a non-owning copy. A miss opens the
   * table inside a short internal write transaction, so these must not be
   * called from a thread which holds an active write transaction. */
  result<db_handle> get_database(const char *name,
                                 unsigned flags = mkv_db_defaults);
  result<db_handle> get_or_create_database(const char *name,
                                           unsigned flags = mkv_db_defaults);
  result<db_handle> get_default_database(unsigned flags = mkv_db_defaults);

  /* Forgets the table in the cache and closes the engine handle, which is
   * allowed only for the owning handle. */
  int close_database(db_handle &handle);

  result<transaction> new_transaction();
  result<readonly_transaction> get_reader();
};

} // namespace mkv

//----------------------------------------------------------------------------

namespace std {
MKV_API string to_string(const mkv_error value);
MKV_API string to_string(const mkv_cursor_op value);
MKV_API string to_string(const mkv::env_state value);
MKV_API string to_string(const mkv::txn_state value);
MKV_API string to_string(const mkv::error_kind value);

MKV_API ostream &operator<<(ostream &out, const mkv_error value);
MKV_API ostream &operator<<(ostream &out, const mkv_cursor_op value);
MKV_API ostream &operator<<(ostream &out, const mkv::env_state value);
MKV_API ostream &operator<<(ostream &out, const mkv::txn_state value);
MKV_API ostream &operator<<(ostream &out, const mkv::error_kind value);
} // namespace std

#endif /* MKV_KV_H */
