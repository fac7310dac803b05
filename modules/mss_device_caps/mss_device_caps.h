#ifndef GUARD_mss_device_caps_H
#define GUARD_mss_device_caps_H

#include "mss_core.h"
#include "mss_sample_count.h"

/*

  Device capabilities are a snapshot of which optional features were enabled
  when a device was created, together with the device's supported sample
  counts.

  Validation code does not read the snapshot directly: it reads a
  `mss_device_caps_query_t`, which any capability source can provide - a
  device caps object (see `get_query`), or, for example, a mock object in
  a test.

*/

struct mss_device_caps_o;

namespace mss {

enum class DeviceFeature : uint32_t {
	eSampleRateShading = 0, // per-sample shading - required to enable sample shading
	eAlphaToOne        = 1, // required to enable alpha-to-one
};

static constexpr uint32_t DEVICE_FEATURE_COUNT = 2;

static constexpr char const* to_str( const DeviceFeature& tp ) {
	switch ( static_cast<uint32_t>( tp ) ) {
		// clang-format off
		case 0: return "sample_rate_shading";
		case 1: return "alpha_to_one";
		default: return "Unknown";
		// clang-format on
	};
}

} // namespace mss

struct mss_device_caps_query_t {
	bool                  ( *is_feature_enabled )( void const* user_data, mss::DeviceFeature feature );
	mss::SampleCountFlags ( *get_supported_sample_counts )( void const* user_data );
	void const* user_data;
};

// clang-format off
struct mss_device_caps_api {

	struct mss_device_caps_interface_t {

		mss_device_caps_o *     ( * create                      ) ();
		void                    ( * destroy                     ) ( mss_device_caps_o* self );

		// Setters return false if the device caps object has been made readonly.
		bool                    ( * set_feature_enabled         ) ( mss_device_caps_o* self, mss::DeviceFeature feature, bool enabled );
		// Returns false if `feature_name` does not name a known feature.
		bool                    ( * set_feature_enabled_by_name ) ( mss_device_caps_o* self, char const* feature_name, bool enabled );
		bool                    ( * is_feature_enabled          ) ( mss_device_caps_o const* self, mss::DeviceFeature feature );

		bool                    ( * set_supported_sample_counts ) ( mss_device_caps_o* self, mss::SampleCountFlags sample_counts );
		mss::SampleCountFlags   ( * get_supported_sample_counts ) ( mss_device_caps_o const* self );

		// Once readonly, capabilities cannot change anymore - call this once the device has been created.
		void                    ( * set_readonly                ) ( mss_device_caps_o* self );
		bool                    ( * is_readonly                 ) ( mss_device_caps_o const* self );

		// Returned query refers to `self`, and is valid for as long as `self` is alive.
		mss_device_caps_query_t ( * get_query                   ) ( mss_device_caps_o const* self );

		// Returns false if `feature_name` does not name a known feature.
		bool                    ( * get_feature_from_name       ) ( char const* feature_name, mss::DeviceFeature* feature );
	};

	mss_device_caps_interface_t mss_device_caps_i;
};
// clang-format on

MSS_MODULE( mss_device_caps );
MSS_MODULE_LOAD( mss_device_caps );

#ifdef __cplusplus

namespace mss_device_caps {
static const auto& api               = mss_device_caps_api_i;
static const auto& mss_device_caps_i = api->mss_device_caps_i;
} // namespace mss_device_caps

namespace mss {

class DeviceCaps : NoCopy, NoMove {

	mss_device_caps_o* self;

  public:
	DeviceCaps()
	    : self( mss_device_caps::mss_device_caps_i.create() ) {
	}

	~DeviceCaps() {
		mss_device_caps::mss_device_caps_i.destroy( self );
	}

	DeviceCaps& setFeatureEnabled( DeviceFeature const& feature, bool enabled = true ) {
		mss_device_caps::mss_device_caps_i.set_feature_enabled( self, feature, enabled );
		return *this;
	}

	DeviceCaps& setSupportedSampleCounts( SampleCountFlags const& sample_counts ) {
		mss_device_caps::mss_device_caps_i.set_supported_sample_counts( self, sample_counts );
		return *this;
	}

	DeviceCaps& setReadonly() {
		mss_device_caps::mss_device_caps_i.set_readonly( self );
		return *this;
	}

	bool isFeatureEnabled( DeviceFeature const& feature ) const {
		return mss_device_caps::mss_device_caps_i.is_feature_enabled( self, feature );
	}

	SampleCountFlags getSupportedSampleCounts() const {
		return mss_device_caps::mss_device_caps_i.get_supported_sample_counts( self );
	}

	bool isReadonly() const {
		return mss_device_caps::mss_device_caps_i.is_readonly( self );
	}

	mss_device_caps_query_t getQuery() const {
		return mss_device_caps::mss_device_caps_i.get_query( self );
	}

	operator mss_device_caps_o*() {
		return self;
	}
};

} // namespace mss

#endif // __cplusplus

#endif
