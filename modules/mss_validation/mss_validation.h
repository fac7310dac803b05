#ifndef GUARD_mss_validation_H
#define GUARD_mss_validation_H

#include "mss_core.h"
#include "mss_device_caps.h"

#include <string>
#include <vector>

namespace mss {

// All features in a RequiresAllOf must be enabled together.
using RequiresAllOf = std::vector<DeviceFeature>;
// Any one of the alternatives in a RequiresOneOf will do.
using RequiresOneOf = std::vector<RequiresAllOf>;

// Produced by types which validate themselves against a device -
// describes why a value may not be used, and what would make it legal.
struct RequirementNotMet {
	std::string   required_for;
	RequiresOneOf requires_one_of;
};

} // namespace mss

struct mss_validation_error_t {

	enum class Kind : uint32_t {
		eUnsupportedSampleCount = 0, // sample count not supported by device
		eCapabilityRequired     = 1, // value requires an optional device feature which was not enabled
		eValueOutOfRange        = 2, // value outside of its declared domain
	};

	Kind                     kind = Kind::eValueOutOfRange;
	std::string              context;         // path of the offending field
	std::string              problem;         // what is wrong with the field's value
	mss::RequiresOneOf       requires_one_of; // features which would make the value legal - empty for value errors
	std::vector<char const*> vuids;           // stable diagnostic codes; opaque, static strings
};

// clang-format off
struct mss_validation_api {

	struct mss_validation_error_interface_t {

		// Renders `error` into `buffer`, including the terminating zero.
		//
		// If `buffer` is nullptr, or `*buffer_size` is too small, nothing is written,
		// `*buffer_size` is set to the number of bytes required, and false is returned.
		bool ( * format           ) ( mss_validation_error_t const* error, char* buffer, size_t* buffer_size );

		// Overwrites `error` with an error of `kind` which carries problem and remedy of `requirement`.
		void ( * from_requirement ) ( mss_validation_error_t* error, mss_validation_error_t::Kind kind, mss::RequirementNotMet const* requirement );
	};

	mss_validation_error_interface_t mss_validation_error_i;
};
// clang-format on

MSS_MODULE( mss_validation );
MSS_MODULE_LOAD( mss_validation );

#ifdef __cplusplus

namespace mss_validation {
static const auto& api                    = mss_validation_api_i;
static const auto& mss_validation_error_i = api->mss_validation_error_i;
} // namespace mss_validation

namespace mss {

using ValidationError = mss_validation_error_t;

static constexpr char const* to_str( const ValidationError::Kind& tp ) {
	switch ( static_cast<uint32_t>( tp ) ) {
		// clang-format off
		case 0: return "UnsupportedSampleCount";
		case 1: return "CapabilityRequired";
		case 2: return "ValueOutOfRange";
		default: return "Unknown";
		// clang-format on
	};
}

inline std::string to_string( ValidationError const& error ) {
	size_t num_bytes = 0;
	mss_validation::mss_validation_error_i.format( &error, nullptr, &num_bytes );

	std::string result( num_bytes, '\0' );
	if ( !mss_validation::mss_validation_error_i.format( &error, result.data(), &num_bytes ) ) {
		return {};
	}

	result.resize( num_bytes - 1 ); // remove terminating zero
	return result;
}

} // namespace mss

#endif // __cplusplus

#endif
