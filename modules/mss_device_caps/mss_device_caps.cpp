#include "mss_device_caps.h"
#include "mss_log.h"

#include <atomic>
#include <cstring>

// Sample counts which a newly created device caps object reports as supported.
// The default, 1 and 4 samples, is what every conformant device must support.
MSS_SETTING( uint32_t, MSS_SETTING_DEVICE_CAPS_DEFAULT_SAMPLE_COUNTS, mss::SampleCountFlagBits::e1 | mss::SampleCountFlagBits::e4 );

struct mss_device_caps_o {
	bool                  enabled_features[ mss::DEVICE_FEATURE_COUNT ] = {}; // indexed by mss::DeviceFeature
	mss::SampleCountFlags supported_sample_counts                      = 0;
	std::atomic_bool      readonly                                     = false;
};

static constexpr auto LOGGER_LABEL = "mss_device_caps";

// ----------------------------------------------------------------------

static mss_device_caps_o* mss_device_caps_create() {
	auto self                     = new mss_device_caps_o();
	self->supported_sample_counts = *MSS_SETTING_DEVICE_CAPS_DEFAULT_SAMPLE_COUNTS;
	return self;
}

// ----------------------------------------------------------------------

static void mss_device_caps_destroy( mss_device_caps_o* self ) {
	delete self;
}

// ----------------------------------------------------------------------

static bool mss_device_caps_set_feature_enabled( mss_device_caps_o* self, mss::DeviceFeature feature, bool enabled ) {
	static auto logger = mss::Log( LOGGER_LABEL );

	if ( self->readonly ) {
		logger.warn( "Cannot change feature '%s': device caps are readonly", mss::to_str( feature ) );
		return false;
	}

	uint32_t index = static_cast<uint32_t>( feature );

	if ( index >= mss::DEVICE_FEATURE_COUNT ) {
		logger.warn( "Cannot change feature: unknown feature id %u", index );
		return false;
	}

	self->enabled_features[ index ] = enabled;
	return true;
}

// ----------------------------------------------------------------------

static bool mss_device_caps_get_feature_from_name( char const* feature_name, mss::DeviceFeature* feature ) {

	if ( nullptr == feature_name ) {
		return false;
	}

	for ( uint32_t i = 0; i != mss::DEVICE_FEATURE_COUNT; i++ ) {
		if ( 0 == strcmp( feature_name, mss::to_str( mss::DeviceFeature( i ) ) ) ) {
			if ( feature ) {
				*feature = mss::DeviceFeature( i );
			}
			return true;
		}
	}

	return false;
}

// ----------------------------------------------------------------------

static bool mss_device_caps_set_feature_enabled_by_name( mss_device_caps_o* self, char const* feature_name, bool enabled ) {

	mss::DeviceFeature feature{};

	if ( false == mss_device_caps_get_feature_from_name( feature_name, &feature ) ) {
		static auto logger = mss::Log( LOGGER_LABEL );
		logger.warn( "Cannot change feature '%s': unknown feature name", feature_name ? feature_name : "<null>" );
		return false;
	}

	return mss_device_caps_set_feature_enabled( self, feature, enabled );
}

// ----------------------------------------------------------------------

static bool mss_device_caps_is_feature_enabled( mss_device_caps_o const* self, mss::DeviceFeature feature ) {
	uint32_t index = static_cast<uint32_t>( feature );
	if ( index >= mss::DEVICE_FEATURE_COUNT ) {
		return false;
	}
	return self->enabled_features[ index ];
}

// ----------------------------------------------------------------------

static bool mss_device_caps_set_supported_sample_counts( mss_device_caps_o* self, mss::SampleCountFlags sample_counts ) {
	if ( self->readonly ) {
		static auto logger = mss::Log( LOGGER_LABEL );
		logger.warn( "Cannot change supported sample counts: device caps are readonly" );
		return false;
	}
	self->supported_sample_counts = sample_counts;
	return true;
}

// ----------------------------------------------------------------------

static mss::SampleCountFlags mss_device_caps_get_supported_sample_counts( mss_device_caps_o const* self ) {
	return self->supported_sample_counts;
}

// ----------------------------------------------------------------------

static void mss_device_caps_set_readonly( mss_device_caps_o* self ) {
	self->readonly = true;
}

static bool mss_device_caps_is_readonly( mss_device_caps_o const* self ) {
	return self->readonly;
}

// ----------------------------------------------------------------------

static mss_device_caps_query_t mss_device_caps_get_query( mss_device_caps_o const* self ) {
	mss_device_caps_query_t query{
	    .is_feature_enabled = []( void const* user_data, mss::DeviceFeature feature ) -> bool {
		    return mss_device_caps_is_feature_enabled( static_cast<mss_device_caps_o const*>( user_data ), feature );
	    },
	    .get_supported_sample_counts = []( void const* user_data ) -> mss::SampleCountFlags {
		    return mss_device_caps_get_supported_sample_counts( static_cast<mss_device_caps_o const*>( user_data ) );
	    },
	    .user_data = self,
	};
	return query;
}

// ----------------------------------------------------------------------

MSS_MODULE_REGISTER_IMPL( mss_device_caps, api ) {
	auto& i = static_cast<mss_device_caps_api*>( api )->mss_device_caps_i;

	i.create                      = mss_device_caps_create;
	i.destroy                     = mss_device_caps_destroy;
	i.set_feature_enabled         = mss_device_caps_set_feature_enabled;
	i.set_feature_enabled_by_name = mss_device_caps_set_feature_enabled_by_name;
	i.is_feature_enabled          = mss_device_caps_is_feature_enabled;
	i.set_supported_sample_counts = mss_device_caps_set_supported_sample_counts;
	i.get_supported_sample_counts = mss_device_caps_get_supported_sample_counts;
	i.set_readonly                = mss_device_caps_set_readonly;
	i.is_readonly                 = mss_device_caps_is_readonly;
	i.get_query                   = mss_device_caps_get_query;
	i.get_feature_from_name       = mss_device_caps_get_feature_from_name;
}
