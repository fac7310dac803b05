#ifndef GUARD_mss_multisample_state_H
#define GUARD_mss_multisample_state_H

#include "mss_core.h"
#include "mss_sample_count.h"
#include "mss_device_caps.h"
#include "mss_validation.h"

#include <optional>
#include <string>
#include <utility>

/*

  Multisample state describes how a graphics pipeline performs multisample
  anti-aliasing: how many samples are taken per pixel, the proportion of
  samples which are shaded individually, a sample mask, and whether the
  alpha channel of fragments shapes coverage.

  A multisample state object is a value - it is created with multisampling
  disabled, and then changed field by field through named setters. There is
  no way to initialise all fields at once.

  Whether a multisample state is legal depends on the device it is used with:
  `validate` checks a state against the capabilities of a device.

*/

struct mss_multisample_state_o;

// clang-format off
struct mss_multisample_state_api {

	struct mss_multisample_state_interface_t {

		// Creates multisample state with multisampling disabled:
		// one sample, no sample shading, all sample mask bits set, alpha-to-coverage and alpha-to-one off.
		mss_multisample_state_o * ( * create  ) ();
		mss_multisample_state_o * ( * clone   ) ( mss_multisample_state_o const* self );
		void                      ( * destroy ) ( mss_multisample_state_o* self );

		// Number of rasterization samples per pixel. Depth and stencil tests run for each sample.
		void                     ( * set_rasterization_samples    ) ( mss_multisample_state_o* self, mss::SampleCountFlagBits const& num_samples );
		mss::SampleCountFlagBits ( * get_rasterization_samples    ) ( mss_multisample_state_o const* self );

		// Minimum fraction of samples [0..1] which must be shaded individually. Setting a value
		// enables sample shading, which requires the `sample_rate_shading` device feature.
		void                     ( * set_sample_shading           ) ( mss_multisample_state_o* self, float const& min_sample_shading );
		void                     ( * clear_sample_shading         ) ( mss_multisample_state_o* self );
		// Returns false if sample shading is disabled, in which case `min_sample_shading` is not written to.
		bool                     ( * get_sample_shading           ) ( mss_multisample_state_o const* self, float* min_sample_shading );

		// Bits ANDed with the coverage mask of each group of `rasterization_samples` samples.
		// Bits beyond the number of rasterization samples are ignored.
		void                     ( * set_sample_mask              ) ( mss_multisample_state_o* self, uint32_t const ( &sample_mask )[ 2 ] );
		void                     ( * get_sample_mask              ) ( mss_multisample_state_o const* self, uint32_t ( &sample_mask )[ 2 ] );

		void                     ( * set_alpha_to_coverage_enable ) ( mss_multisample_state_o* self, bool const& enable );
		bool                     ( * get_alpha_to_coverage_enable ) ( mss_multisample_state_o const* self );

		// Requires the `alpha_to_one` device feature if enabled.
		void                     ( * set_alpha_to_one_enable      ) ( mss_multisample_state_o* self, bool const& enable );
		bool                     ( * get_alpha_to_one_enable      ) ( mss_multisample_state_o const* self );

		bool                     ( * is_equal                     ) ( mss_multisample_state_o const* lhs, mss_multisample_state_o const* rhs );
		uint64_t                 ( * get_hash                     ) ( mss_multisample_state_o const* self );

		// Same buffer protocol as mss_validation_error_i.format
		bool                     ( * to_str                       ) ( mss_multisample_state_o const* self, char* buffer, size_t* buffer_size );

		// Checks whether `self` may be used with the device behind `device`. Checks are run in
		// a fixed order, and the first failing check wins.
		//
		// Returns true if valid, otherwise returns false and fills in `error` (if not nullptr).
		bool                     ( * validate                     ) ( mss_multisample_state_o const* self, mss_device_caps_query_t const* device, mss_validation_error_t* error );
	};

	mss_multisample_state_interface_t mss_multisample_state_i;
};
// clang-format on

MSS_MODULE( mss_multisample_state );
MSS_MODULE_LOAD( mss_multisample_state );

#ifdef __cplusplus

namespace mss_multisample_state {
static const auto& api                     = mss_multisample_state_api_i;
static const auto& mss_multisample_state_i = api->mss_multisample_state_i;
} // namespace mss_multisample_state

namespace mss {

class MultisampleState {

	mss_multisample_state_o* self;

  public:
	MultisampleState()
	    : self( mss_multisample_state::mss_multisample_state_i.create() ) {
	}

	MultisampleState( MultisampleState const& rhs )
	    : self( mss_multisample_state::mss_multisample_state_i.clone( rhs.self ) ) {
	}

	// Leaves `rhs` holding the default state.
	MultisampleState( MultisampleState&& rhs )
	    : self( std::exchange( rhs.self, mss_multisample_state::mss_multisample_state_i.create() ) ) {
	}

	MultisampleState& operator=( MultisampleState const& rhs ) {
		if ( this != &rhs ) {
			auto copy = mss_multisample_state::mss_multisample_state_i.clone( rhs.self );
			mss_multisample_state::mss_multisample_state_i.destroy( self );
			self = copy;
		}
		return *this;
	}

	MultisampleState& operator=( MultisampleState&& rhs ) noexcept {
		std::swap( self, rhs.self );
		return *this;
	}

	~MultisampleState() {
		mss_multisample_state::mss_multisample_state_i.destroy( self );
	}

	MultisampleState& setRasterizationSamples( SampleCountFlagBits const& num_samples ) {
		mss_multisample_state::mss_multisample_state_i.set_rasterization_samples( self, num_samples );
		return *this;
	}

	MultisampleState& setSampleShading( float const& min_sample_shading ) {
		mss_multisample_state::mss_multisample_state_i.set_sample_shading( self, min_sample_shading );
		return *this;
	}

	MultisampleState& clearSampleShading() {
		mss_multisample_state::mss_multisample_state_i.clear_sample_shading( self );
		return *this;
	}

	MultisampleState& setSampleMask( uint32_t const ( &sample_mask )[ 2 ] ) {
		mss_multisample_state::mss_multisample_state_i.set_sample_mask( self, sample_mask );
		return *this;
	}

	MultisampleState& setAlphaToCoverageEnable( bool const& enable ) {
		mss_multisample_state::mss_multisample_state_i.set_alpha_to_coverage_enable( self, enable );
		return *this;
	}

	MultisampleState& setAlphaToOneEnable( bool const& enable ) {
		mss_multisample_state::mss_multisample_state_i.set_alpha_to_one_enable( self, enable );
		return *this;
	}

	SampleCountFlagBits getRasterizationSamples() const {
		return mss_multisample_state::mss_multisample_state_i.get_rasterization_samples( self );
	}

	std::optional<float> getSampleShading() const {
		float value = 0.f;
		if ( mss_multisample_state::mss_multisample_state_i.get_sample_shading( self, &value ) ) {
			return value;
		}
		return std::nullopt;
	}

	void getSampleMask( uint32_t ( &sample_mask )[ 2 ] ) const {
		mss_multisample_state::mss_multisample_state_i.get_sample_mask( self, sample_mask );
	}

	bool getAlphaToCoverageEnable() const {
		return mss_multisample_state::mss_multisample_state_i.get_alpha_to_coverage_enable( self );
	}

	bool getAlphaToOneEnable() const {
		return mss_multisample_state::mss_multisample_state_i.get_alpha_to_one_enable( self );
	}

	uint64_t hash() const {
		return mss_multisample_state::mss_multisample_state_i.get_hash( self );
	}

	std::string toString() const {
		size_t num_bytes = 0;
		mss_multisample_state::mss_multisample_state_i.to_str( self, nullptr, &num_bytes );

		std::string result( num_bytes, '\0' );
		if ( !mss_multisample_state::mss_multisample_state_i.to_str( self, result.data(), &num_bytes ) ) {
			return {};
		}

		result.resize( num_bytes - 1 ); // remove terminating zero
		return result;
	}

	bool validate( mss_device_caps_query_t const& device, ValidationError* error = nullptr ) const {
		return mss_multisample_state::mss_multisample_state_i.validate( self, &device, error );
	}

	bool validate( DeviceCaps const& device, ValidationError* error = nullptr ) const {
		auto query = device.getQuery();
		return mss_multisample_state::mss_multisample_state_i.validate( self, &query, error );
	}

	bool operator==( MultisampleState const& rhs ) const {
		return mss_multisample_state::mss_multisample_state_i.is_equal( self, rhs.self );
	}

	bool operator!=( MultisampleState const& rhs ) const {
		return !( *this == rhs );
	}

	operator mss_multisample_state_o const*() const {
		return self;
	}
};

} // namespace mss

#endif // __cplusplus

#endif
