#ifndef GUARD_mss_sample_count_H
#define GUARD_mss_sample_count_H

#include "mss_core.h"

struct mss_device_caps_query_t;

namespace mss {

struct RequirementNotMet;

using SampleCountFlags = uint32_t;
enum class SampleCountFlagBits : SampleCountFlags {
	e1  = 0x00000001, // Sample count 1 supported
	e2  = 0x00000002, // Sample count 2 supported
	e4  = 0x00000004, // Sample count 4 supported
	e8  = 0x00000008, // Sample count 8 supported
	e16 = 0x00000010, // Sample count 16 supported
	e32 = 0x00000020, // Sample count 32 supported
	e64 = 0x00000040, // Sample count 64 supported
};

constexpr SampleCountFlags operator|( SampleCountFlagBits const& lhs, SampleCountFlagBits const& rhs ) noexcept {
	return static_cast<const SampleCountFlags>( static_cast<SampleCountFlags>( lhs ) | static_cast<SampleCountFlags>( rhs ) );
};

constexpr SampleCountFlags operator|( SampleCountFlags const& lhs, SampleCountFlagBits const& rhs ) noexcept {
	return static_cast<const SampleCountFlags>( lhs | static_cast<SampleCountFlags>( rhs ) );
};

constexpr SampleCountFlags operator&( SampleCountFlags const& lhs, SampleCountFlagBits const& rhs ) noexcept {
	return static_cast<const SampleCountFlags>( lhs & static_cast<SampleCountFlags>( rhs ) );
};

static constexpr char const* to_str( const SampleCountFlagBits& tp ) {
	switch ( static_cast<SampleCountFlags>( tp ) ) {
		// clang-format off
		case 0x00000001: return "1";
		case 0x00000002: return "2";
		case 0x00000004: return "4";
		case 0x00000008: return "8";
		case 0x00000010: return "16";
		case 0x00000020: return "32";
		case 0x00000040: return "64";
		default: return "Unknown";
		// clang-format on
	};
}

} // namespace mss

// clang-format off
struct mss_sample_count_api {

	struct mss_sample_count_interface_t {

		// Returns the number of samples represented by `sample_count`, or 0 if `sample_count` is not
		// exactly one of the defined values.
		uint32_t ( * get_sample_count ) ( mss::SampleCountFlagBits sample_count );
		bool     ( * is_valid         ) ( mss::SampleCountFlagBits sample_count );

		// Checks that `sample_count` may be used with the device behind `device`.
		// Returns false and fills in `requirement` if it may not.
		bool     ( * validate_device  ) ( mss::SampleCountFlagBits sample_count, mss_device_caps_query_t const* device, mss::RequirementNotMet* requirement );
	};

	mss_sample_count_interface_t mss_sample_count_i;
};
// clang-format on

MSS_MODULE( mss_sample_count );
MSS_MODULE_LOAD( mss_sample_count );

#ifdef __cplusplus

namespace mss_sample_count {
static const auto& api                = mss_sample_count_api_i;
static const auto& mss_sample_count_i = api->mss_sample_count_i;
} // namespace mss_sample_count

#endif // __cplusplus

#endif
