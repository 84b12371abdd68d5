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
#include "mkv/kv.h"

/*----------------------------------------------------------------------------*/
/* Threads */

#ifdef CMAKE_HAVE_PTHREAD_H
#include <pthread.h>

typedef struct mkv_mutex {
  pthread_mutex_t ptmx;
} mkv_mutex_t;

static int __inline mkv_mutex_init(mkv_mutex_t *mutex) {
  return pthread_mutex_init(&mutex->ptmx, NULL);
}

static int __inline mkv_mutex_lock(mkv_mutex_t *mutex) {
  return pthread_mutex_lock(&mutex->ptmx);
}

static int __inline mkv_mutex_unlock(mkv_mutex_t *mutex) {
  return pthread_mutex_unlock(&mutex->ptmx);
}

static int __inline mkv_mutex_destroy(mkv_mutex_t *mutex) {
  return pthread_mutex_destroy(&mutex->ptmx);
}

#else

#include <windows.h>

typedef struct mkv_mutex {
  CRITICAL_SECTION cs;
} mkv_mutex_t;

static int __inline mkv_mutex_init(mkv_mutex_t *mutex) {
  if (!mutex)
    return MKV_EINVAL;
  InitializeCriticalSection(&mutex->cs);
  return MKV_SUCCESS;
}

static int __inline mkv_mutex_lock(mkv_mutex_t *mutex) {
  if (!mutex)
    return MKV_EINVAL;
  EnterCriticalSection(&mutex->cs);
  return MKV_SUCCESS;
}

static int __inline mkv_mutex_unlock(mkv_mutex_t *mutex) {
  if (!mutex)
    return MKV_EINVAL;
  LeaveCriticalSection(&mutex->cs);
  return MKV_SUCCESS;
}

static int __inline mkv_mutex_destroy(mkv_mutex_t *mutex) {
  if (!mutex)
    return MKV_EINVAL;
  DeleteCriticalSection(&mutex->cs);
  return MKV_SUCCESS;
}

#endif /* CMAKE_HAVE_PTHREAD_H */

/*----------------------------------------------------------------------------*/
/* Filesystem */

/* Creates the directory and all missing parents, like "mkdir -p". */
int mkv_mkdir_p(const char *path, mode_t mode);

/* Kind of the filesystem object at the path. */
enum mkv_path_kind { mkv_path_absent, mkv_path_file, mkv_path_dir };
int mkv_path_inspect(const char *path, mkv_path_kind *kind);
