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

using namespace mkv;

int mkv_cursor_open(mkv_txn *txn, engine_dbi dbi, unsigned db_flags,
                    mkv_cursor **pcursor) {
  *pcursor = nullptr;
  mkv_cursor *cursor = new (std::nothrow) mkv_cursor(txn, dbi, db_flags);
  if (unlikely(cursor == nullptr))
    return MKV_ENOMEM;

  const int rc = cursor->engine->cursor_open(txn->handle, dbi, &cursor->handle);
  if (unlikely(rc != MKV_SUCCESS)) {
    delete cursor;
    return rc;
  }

  *pcursor = cursor;
  return MKV_SUCCESS;
}

/* The engine wants cursors to be closed explicitly, even after the
 * transaction has ended. */
void mkv_cursor_free(mkv_cursor *cursor) {
  if (cursor->handle)
    cursor->engine->cursor_close(cursor->handle);
  delete cursor;
}

int database::open_cursor(mkv_cursor **pcursor) const {
  int rc = validate("new_cursor");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return mkv_cursor_open(txn_, handle_.dbi(), handle_.flags(), pcursor);
}

result<cursor> database::new_cursor() const {
  mkv_cursor *handle;
  const int rc = open_cursor(&handle);
  if (unlikely(rc != MKV_SUCCESS))
    return result<cursor>(rc);
  return result<cursor>(MKV_SUCCESS, cursor(handle));
}

result<writable_cursor> writable_database::new_cursor() const {
  mkv_cursor *handle;
  const int rc = open_cursor(&handle);
  if (unlikely(rc != MKV_SUCCESS))
    return result<writable_cursor>(rc);
  return result<writable_cursor>(MKV_SUCCESS, writable_cursor(handle));
}

//----------------------------------------------------------------------------

cursor &cursor::operator=(cursor &&other) noexcept {
  if (this != &other) {
    if (cursor_)
      mkv_cursor_free(cursor_);
    cursor_ = other.cursor_;
    other.cursor_ = nullptr;
  }
  return *this;
}

cursor::~cursor() {
  if (cursor_)
    mkv_cursor_free(cursor_);
}

int cursor::close() {
  if (unlikely(cursor_ == nullptr))
    return MKV_EINVAL;
  mkv_cursor_free(cursor_);
  cursor_ = nullptr;
  return MKV_SUCCESS;
}

__hot int cursor::move(mkv_cursor_op op) {
  int rc = mkv_cursor_validate(cursor_, "cursor move");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  slice key, value;
  return cursor_->engine->cursor_get(cursor_->handle, &key, &value, op);
}

__hot int cursor::seek(mkv_cursor_op op, const slice &key) {
  int rc = mkv_cursor_validate(cursor_, "cursor seek");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  slice here = key, value;
  return cursor_->engine->cursor_get(cursor_->handle, &here, &value, op);
}

int cursor::seek(mkv_cursor_op op, const slice &key, const slice &value) {
  int rc = mkv_cursor_validate(cursor_, "cursor seek");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  slice here = key, item = value;
  return cursor_->engine->cursor_get(cursor_->handle, &here, &item, op);
}

__hot int cursor::fetch(slice *key, slice *value) const {
  int rc = mkv_cursor_validate(cursor_, "cursor fetch");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;

  slice k, v;
  rc = cursor_->engine->cursor_get(cursor_->handle, &k, &v, mkv_get_current);
  if (likely(rc == MKV_SUCCESS)) {
    if (key)
      *key = k;
    if (value)
      *value = v;
  }
  return rc;
}

result<size_t> cursor::item_count() const {
  int rc = mkv_cursor_validate(cursor_, "item_count");
  if (unlikely(rc != MKV_SUCCESS))
    return result<size_t>(rc);

  size_t count = 0;
  rc = cursor_->engine->cursor_count(cursor_->handle, &count);
  return result<size_t>(rc, count);
}

__hot result<int> cursor::compare_key(const slice &other) const {
  slice key;
  const int rc = fetch(&key, nullptr);
  if (unlikely(rc != MKV_SUCCESS))
    return result<int>(rc);
  return result<int>(MKV_SUCCESS, cursor_->engine->cmp(cursor_->txn->handle,
                                                      cursor_->dbi, key,
                                                      other));
}

//----------------------------------------------------------------------------

int writable_cursor::put(const slice &key, const slice &value,
                         unsigned flags) {
  int rc = mkv_cursor_validate(cursor_, "cursor put");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return cursor_->engine->cursor_put(cursor_->handle, key, value, flags);
}

/* The current key lives on a page which the update may rearrange, so it is
 * copied before being handed back to the engine. */
static int mkv_cursor_put_current(mkv_cursor *cursor, const slice &current,
                                  const slice &value, unsigned flags) {
  const std::string key(current.char_ptr(), current.size());
  return cursor->engine->cursor_put(cursor->handle, slice(key), value,
                                    flags);
}

/* The engine checks the key of an in-place update against the current
 * position, so the current key is passed back to it. */
int writable_cursor::replace_current(const slice &value) {
  slice key;
  const int rc = fetch(&key, nullptr);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return mkv_cursor_put_current(cursor_, key, value, mkv_current);
}

int writable_cursor::add_to_current(const slice &value) {
  slice key;
  const int rc = fetch(&key, nullptr);
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return mkv_cursor_put_current(cursor_, key, value,
                                (cursor_->db_flags & mkv_dupsort)
                                    ? mkv_nodupdata
                                    : mkv_nooverwrite);
}

int writable_cursor::del_single() {
  int rc = mkv_cursor_validate(cursor_, "del_single");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return cursor_->engine->cursor_del(cursor_->handle, mkv_upsert);
}

int writable_cursor::del_all() {
  int rc = mkv_cursor_validate(cursor_, "del_all");
  if (unlikely(rc != MKV_SUCCESS))
    return rc;
  return cursor_->engine->cursor_del(cursor_->handle, mkv_alldups);
}
