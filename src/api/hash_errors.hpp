#ifndef HASH_ERRORS_HPP
#define HASH_ERRORS_HPP

#include <stdint.h>

/* Result codes returned by every entry point of the hash library */
#define HASH_ERROR_OK                   0u
#define HASH_ERROR_EXCEPTION            1u
#define HASH_ERROR_ALREADY_INITIALIZED  2u
#define HASH_ERROR_ARGUMENT_NULL        3u
#define HASH_ERROR_ARGUMENT_INVALID     4u
#define HASH_ERROR_MEMORY               5u
#define HASH_ERROR_LOG_EMPTY            6u
#define HASH_ERROR_NOT_INITIALIZED      7u

typedef uint32_t HashResult;

#endif /* HASH_ERRORS_HPP */
