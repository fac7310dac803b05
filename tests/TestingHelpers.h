#pragma once

#include "mss_device_caps.h"
#include "mss_sample_count.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mss::testing {

// A capability source which is not a mss_device_caps_o - validation code must
// only ever talk to devices through mss_device_caps_query_t.
struct MockDevice {
	bool             sample_rate_shading     = false;
	bool             alpha_to_one            = false;
	SampleCountFlags supported_sample_counts = SampleCountFlags( SampleCountFlagBits::e1 );

	mutable uint32_t num_feature_queries = 0;

	mss_device_caps_query_t query() const {
		return mss_device_caps_query_t{
		    .is_feature_enabled = []( void const* user_data, DeviceFeature feature ) -> bool {
			    auto self = static_cast<MockDevice const*>( user_data );
			    self->num_feature_queries++;
			    switch ( feature ) {
			    case DeviceFeature::eSampleRateShading:
				    return self->sample_rate_shading;
			    case DeviceFeature::eAlphaToOne:
				    return self->alpha_to_one;
			    }
			    return false;
		    },
		    .get_supported_sample_counts = []( void const* user_data ) -> SampleCountFlags {
			    return static_cast<MockDevice const*>( user_data )->supported_sample_counts;
		    },
		    .user_data = this,
		};
	}
};

// Collects log lines - use as user_data with CaptureLogLines as log subscriber.
struct CapturedLogLines {
	std::vector<std::string> lines;

	bool contains( std::string const& needle ) const {
		for ( auto const& l : lines ) {
			if ( l.find( needle ) != std::string::npos ) {
				return true;
			}
		}
		return false;
	}
};

inline void CaptureLogLines( char* chars, uint32_t num_chars, void* user_data ) {
	static_cast<CapturedLogLines*>( user_data )->lines.emplace_back( chars, num_chars );
}

} // namespace mss::testing
