#ifndef GUARD_MSS_HASH_UTIL_H
#define GUARD_MSS_HASH_UTIL_H

#include <stdint.h>
#include <stddef.h>

constexpr uint64_t FNV1A_VAL_64_CONST   = 0xcbf29ce484222325;
constexpr uint64_t FNV1A_PRIME_64_CONST = 0x100000001b3;

// Returns a compile-time calculated 64 bit fnv hash for a given constant string.
// Adapted from: https://notes.underscorediscovery.com/constexpr-fnv1a/
inline constexpr uint64_t hash_64_fnv1a_const( const char *const str, const uint64_t value = FNV1A_VAL_64_CONST ) noexcept {
	return ( *str ) ? hash_64_fnv1a_const( str + 1, ( value ^ uint64_t( *str ) ) * FNV1A_PRIME_64_CONST ) : value;
}

// ----------------------------------------------------------------------

// Adapted from: https://notes.underscorediscovery.com/constexpr-fnv1a/
inline uint64_t hash_64_fnv1a( char const *const input ) noexcept {

	uint64_t           hash  = FNV1A_VAL_64_CONST;
	constexpr uint64_t prime = FNV1A_PRIME_64_CONST;

	for ( char const *i = input; *i != 0; ++i ) {
		uint8_t value = static_cast<const uint8_t &>( *i );
		hash          = hash ^ value;
		hash          = hash * prime;
	}

	return hash;

} //hash_64_fnv1a

// ----------------------------------------------------------------------
// Hashes `num_bytes` bytes starting at `data`. Pass the result of a previous
// call as `hash` to continue hashing over multiple ranges.
inline uint64_t hash_64_fnv1a_bytes( void const *const data, size_t num_bytes, uint64_t hash = FNV1A_VAL_64_CONST ) noexcept {

	constexpr uint64_t prime = FNV1A_PRIME_64_CONST;

	uint8_t const *bytes = static_cast<uint8_t const *>( data );

	for ( size_t i = 0; i != num_bytes; ++i ) {
		hash = hash ^ bytes[ i ];
		hash = hash * prime;
	}

	return hash;

} //hash_64_fnv1a_bytes

#endif
