#ifndef HASH_LIBRARY_HPP
#define HASH_LIBRARY_HPP

#include <stdbool.h>
#include <stddef.h>
#include "api/hash_errors.hpp"

#if defined(_WIN32)
#define HASH_API __declspec(dllexport)
#else
#define HASH_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Asynchronous directory hashing.
 *
 * HashInit must succeed before any other call except HashFree. Every hashed file
 * produces one line "<tag> <relative-path> <32 hex digits>" read back with
 * HashReadNextLogLine; each returned line is owned by the caller until passed
 * to HashFree exactly once. HashTerminate blocks until all work has stopped.
 */

HASH_API HashResult HashInit(void);
HASH_API HashResult HashTerminate(void);

/* Starts hashing path in the background. *operation_id is read as the requested
 * identifier and always holds the identifier actually used on success. */
HASH_API HashResult HashDirectory(const char* path, size_t* operation_id);

/* HASH_ERROR_LOG_EMPTY when no line is available; *line is then left untouched. */
HASH_API HashResult HashReadNextLogLine(char** line);

HASH_API HashResult HashStatus(size_t operation_id, bool* running);

/* Cooperative and idempotent: work already in progress is allowed to finish. */
HASH_API HashResult HashStop(size_t operation_id);

/* Forgets a finished operation. Running operations cannot be reaped. */
HASH_API HashResult HashReap(size_t operation_id);

/* Releases a line returned by HashReadNextLogLine. Null is ignored. */
HASH_API void HashFree(void* pointer);

#ifdef __cplusplus
}
#endif

#endif /* HASH_LIBRARY_HPP */
