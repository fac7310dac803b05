#include "mss_sample_count.h"
#include "mss_device_caps.h"
#include "mss_validation.h"

#include <string>

// ----------------------------------------------------------------------

static bool mss_sample_count_is_valid( mss::SampleCountFlagBits sample_count ) {
	auto value = static_cast<mss::SampleCountFlags>( sample_count );

	// Exactly one bit must be set, and it must be one of the defined bits.
	return value != 0 &&
	       ( value & ( value - 1 ) ) == 0 &&
	       value <= static_cast<mss::SampleCountFlags>( mss::SampleCountFlagBits::e64 );
}

// ----------------------------------------------------------------------

static uint32_t mss_sample_count_get_sample_count( mss::SampleCountFlagBits sample_count ) {
	if ( !mss_sample_count_is_valid( sample_count ) ) {
		return 0;
	}
	// Sample count flag bits are laid out so that the value of each bit is the number of samples it stands for.
	return static_cast<uint32_t>( sample_count );
}

// ----------------------------------------------------------------------
// Returns a human-readable list of all sample counts set in `sample_counts`, e.g. "1, 4"
static std::string sample_counts_to_string( mss::SampleCountFlags sample_counts ) {
	std::string result;

	for ( mss::SampleCountFlags bit = 1; bit <= static_cast<mss::SampleCountFlags>( mss::SampleCountFlagBits::e64 ); bit <<= 1 ) {
		if ( sample_counts & bit ) {
			if ( !result.empty() ) {
				result += ", ";
			}
			result += mss::to_str( mss::SampleCountFlagBits( bit ) );
		}
	}

	if ( result.empty() ) {
		result = "none";
	}

	return result;
}

// ----------------------------------------------------------------------

static bool mss_sample_count_validate_device( mss::SampleCountFlagBits sample_count, mss_device_caps_query_t const* device, mss::RequirementNotMet* requirement ) {

	if ( !mss_sample_count_is_valid( sample_count ) ) {
		if ( requirement ) {
			*requirement              = {};
			requirement->required_for = "is not a valid sample count value";
		}
		return false;
	}

	// ---------| invariant: sample_count is exactly one of the defined values

	mss::SampleCountFlags supported_sample_counts = device->get_supported_sample_counts( device->user_data );

	if ( 0 == ( supported_sample_counts & sample_count ) ) {
		if ( requirement ) {
			*requirement = {};
			requirement->required_for =
			    std::string( "is " ) + mss::to_str( sample_count ) +
			    ", which is not supported by the device (supported sample counts: " +
			    sample_counts_to_string( supported_sample_counts ) + ")";
		}
		return false;
	}

	return true;
}

// ----------------------------------------------------------------------

MSS_MODULE_REGISTER_IMPL( mss_sample_count, api ) {
	auto& i = static_cast<mss_sample_count_api*>( api )->mss_sample_count_i;

	i.get_sample_count = mss_sample_count_get_sample_count;
	i.is_valid         = mss_sample_count_is_valid;
	i.validate_device  = mss_sample_count_validate_device;
}
