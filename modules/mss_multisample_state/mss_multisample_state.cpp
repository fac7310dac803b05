#include "mss_multisample_state.h"
#include "mss_core.h"
#include "mss_hash_util.h"
#include "mss_log.h"

#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

// Log every failed validation on the "mss_multisample_state" channel, at warn level.
MSS_SETTING( bool, MSS_SETTING_SHOULD_LOG_VALIDATION_ERRORS, false );

static constexpr auto LOGGER_LABEL = "mss_multisample_state";

// TODO: handle interaction of sample shading with non-floating-point attachments,
// once attachment formats are known to multisample state.

struct mss_multisample_state_o {
	mss::SampleCountFlagBits rasterization_samples    = mss::SampleCountFlagBits::e1;
	bool                     sample_shading_enable    = false;
	float                    min_sample_shading       = 0.f;                      // only meaningful if sample_shading_enable
	uint32_t                 sample_mask[ 2 ]         = { 0xFFFFFFFF, 0xFFFFFFFF }; // 64 bits needed for 64 samples
	bool                     alpha_to_coverage_enable = false;
	bool                     alpha_to_one_enable      = false;
};

// ----------------------------------------------------------------------

static mss_multisample_state_o* mss_multisample_state_create() {
	auto self = new mss_multisample_state_o();
	return self;
}

// ----------------------------------------------------------------------

static mss_multisample_state_o* mss_multisample_state_clone( mss_multisample_state_o const* self ) {
	auto obj = new mss_multisample_state_o( *self );
	return obj;
}

// ----------------------------------------------------------------------

static void mss_multisample_state_destroy( mss_multisample_state_o* self ) {
	delete self;
}

// ----------------------------------------------------------------------

static void mss_multisample_state_set_rasterization_samples( mss_multisample_state_o* self, mss::SampleCountFlagBits const& num_samples ) {
	self->rasterization_samples = num_samples;
}
static mss::SampleCountFlagBits mss_multisample_state_get_rasterization_samples( mss_multisample_state_o const* self ) {
	return self->rasterization_samples;
}
static void mss_multisample_state_set_sample_shading( mss_multisample_state_o* self, float const& min_sample_shading ) {
	self->sample_shading_enable = true;
	self->min_sample_shading    = min_sample_shading;
}
static void mss_multisample_state_clear_sample_shading( mss_multisample_state_o* self ) {
	self->sample_shading_enable = false;
	self->min_sample_shading    = 0.f;
}
static bool mss_multisample_state_get_sample_shading( mss_multisample_state_o const* self, float* min_sample_shading ) {
	if ( self->sample_shading_enable && min_sample_shading ) {
		*min_sample_shading = self->min_sample_shading;
	}
	return self->sample_shading_enable;
}
static void mss_multisample_state_set_sample_mask( mss_multisample_state_o* self, uint32_t const ( &sample_mask )[ 2 ] ) {
	self->sample_mask[ 0 ] = sample_mask[ 0 ];
	self->sample_mask[ 1 ] = sample_mask[ 1 ];
}
static void mss_multisample_state_get_sample_mask( mss_multisample_state_o const* self, uint32_t ( &sample_mask )[ 2 ] ) {
	sample_mask[ 0 ] = self->sample_mask[ 0 ];
	sample_mask[ 1 ] = self->sample_mask[ 1 ];
}
static void mss_multisample_state_set_alpha_to_coverage_enable( mss_multisample_state_o* self, bool const& enable ) {
	self->alpha_to_coverage_enable = enable;
}
static bool mss_multisample_state_get_alpha_to_coverage_enable( mss_multisample_state_o const* self ) {
	return self->alpha_to_coverage_enable;
}
static void mss_multisample_state_set_alpha_to_one_enable( mss_multisample_state_o* self, bool const& enable ) {
	self->alpha_to_one_enable = enable;
}
static bool mss_multisample_state_get_alpha_to_one_enable( mss_multisample_state_o const* self ) {
	return self->alpha_to_one_enable;
}

// ----------------------------------------------------------------------
// All NaNs are the same ratio, and -0 is the same ratio as 0, so that
// equality is reflexive, and equal states hash equal.
static float canonical_sample_shading( float value ) {
	if ( std::isnan( value ) ) {
		return std::numeric_limits<float>::quiet_NaN();
	}
	return value == 0.f ? 0.f : value;
}

static bool is_same_sample_shading( float lhs, float rhs ) {
	return lhs == rhs || ( std::isnan( lhs ) && std::isnan( rhs ) );
}

// ----------------------------------------------------------------------
// Two states are equal if all their fields are equal - the sample shading
// ratio only takes part in the comparison if sample shading is enabled.
static bool mss_multisample_state_is_equal( mss_multisample_state_o const* lhs, mss_multisample_state_o const* rhs ) {

	if ( lhs == rhs ) {
		return true;
	}

	if ( lhs->sample_shading_enable != rhs->sample_shading_enable ) {
		return false;
	}

	if ( lhs->sample_shading_enable && !is_same_sample_shading( lhs->min_sample_shading, rhs->min_sample_shading ) ) {
		return false;
	}

	return lhs->rasterization_samples == rhs->rasterization_samples &&
	       lhs->sample_mask[ 0 ] == rhs->sample_mask[ 0 ] &&
	       lhs->sample_mask[ 1 ] == rhs->sample_mask[ 1 ] &&
	       lhs->alpha_to_coverage_enable == rhs->alpha_to_coverage_enable &&
	       lhs->alpha_to_one_enable == rhs->alpha_to_one_enable;
}

// ----------------------------------------------------------------------
// Builds a hash value from the multisample state, so that we have a
// fingerprint which may be used to deduplicate pipeline state.
// States which compare equal have equal hashes.
static uint64_t mss_multisample_state_get_hash( mss_multisample_state_o const* self ) {

	// We hash field by field so that padding bytes don't influence the hash.

	uint32_t rasterization_samples = static_cast<uint32_t>( self->rasterization_samples );
	uint8_t  flags                 = uint8_t( self->sample_shading_enable ) |
	                uint8_t( self->alpha_to_coverage_enable ) << 1 |
	                uint8_t( self->alpha_to_one_enable ) << 2;

	uint64_t hash = hash_64_fnv1a_bytes( &rasterization_samples, sizeof( rasterization_samples ) );
	hash          = hash_64_fnv1a_bytes( &flags, sizeof( flags ), hash );
	hash          = hash_64_fnv1a_bytes( self->sample_mask, sizeof( self->sample_mask ), hash );

	if ( self->sample_shading_enable ) {
		float min_sample_shading = canonical_sample_shading( self->min_sample_shading );
		hash                     = hash_64_fnv1a_bytes( &min_sample_shading, sizeof( min_sample_shading ), hash );
	}

	return hash;
}

// ----------------------------------------------------------------------

static bool mss_multisample_state_to_str( mss_multisample_state_o const* self, char* buffer, size_t* buffer_size ) {

	if ( nullptr == buffer_size ) {
		return false;
	}

	char sample_shading_str[ 32 ] = "None";

	if ( self->sample_shading_enable ) {
		snprintf( sample_shading_str, sizeof( sample_shading_str ), "%g", double( self->min_sample_shading ) );
	}

	// snprintf tells us how many bytes it needs, if buffer is too small.
	int num_chars = snprintf( nullptr, 0,
	                          "MultisampleState { rasterization_samples: %s, sample_shading: %s, sample_mask: [0x%08x, 0x%08x], alpha_to_coverage_enable: %s, alpha_to_one_enable: %s }",
	                          mss::to_str( self->rasterization_samples ),
	                          sample_shading_str,
	                          self->sample_mask[ 0 ],
	                          self->sample_mask[ 1 ],
	                          self->alpha_to_coverage_enable ? "true" : "false",
	                          self->alpha_to_one_enable ? "true" : "false" );

	if ( num_chars < 0 ) {
		return false;
	}

	size_t num_bytes_required = size_t( num_chars ) + 1;

	if ( nullptr == buffer || *buffer_size < num_bytes_required ) {
		*buffer_size = num_bytes_required;
		return false;
	}

	snprintf( buffer, num_bytes_required,
	          "MultisampleState { rasterization_samples: %s, sample_shading: %s, sample_mask: [0x%08x, 0x%08x], alpha_to_coverage_enable: %s, alpha_to_one_enable: %s }",
	          mss::to_str( self->rasterization_samples ),
	          sample_shading_str,
	          self->sample_mask[ 0 ],
	          self->sample_mask[ 1 ],
	          self->alpha_to_coverage_enable ? "true" : "false",
	          self->alpha_to_one_enable ? "true" : "false" );

	*buffer_size = num_bytes_required;

	return true;
}

// ----------------------------------------------------------------------

static bool validate_impl( mss_multisample_state_o const* self, mss_device_caps_query_t const* device, mss_validation_error_t* error ) {

	using Kind = mss_validation_error_t::Kind;

	{
		mss::RequirementNotMet requirement{};

		if ( !mss_sample_count::mss_sample_count_i.validate_device( self->rasterization_samples, device, &requirement ) ) {
			mss_validation::mss_validation_error_i.from_requirement( error, Kind::eUnsupportedSampleCount, &requirement );
			error->context = "rasterization_samples";
			error->vuids   = { "VUID-VkPipelineMultisampleStateCreateInfo-rasterizationSamples-parameter" };
			return false;
		}
	}

	if ( self->sample_shading_enable ) {

		if ( !device->is_feature_enabled( device->user_data, mss::DeviceFeature::eSampleRateShading ) ) {
			*error = {
			    .kind            = Kind::eCapabilityRequired,
			    .context         = "sample_shading",
			    .problem         = "is `Some`",
			    .requires_one_of = { { mss::DeviceFeature::eSampleRateShading } },
			    .vuids           = { "VUID-VkPipelineMultisampleStateCreateInfo-sampleShadingEnable-00784" },
			};
			return false;
		}

		// Written so that NaN fails the range check.
		if ( !( self->min_sample_shading >= 0.f && self->min_sample_shading <= 1.f ) ) {
			*error = {
			    .kind    = Kind::eValueOutOfRange,
			    .context = "sample_shading",
			    .problem = "is not between 0.0 and 1.0 inclusive",
			    .vuids   = { "VUID-VkPipelineMultisampleStateCreateInfo-minSampleShading-00786" },
			};
			return false;
		}
	}

	// Any sample mask is legal: bits beyond the number of rasterization samples are ignored.
	// Alpha-to-coverage needs no device feature.

	if ( self->alpha_to_one_enable &&
	     !device->is_feature_enabled( device->user_data, mss::DeviceFeature::eAlphaToOne ) ) {
		*error = {
		    .kind            = Kind::eCapabilityRequired,
		    .context         = "alpha_to_one_enable",
		    .problem         = "is `true`",
		    .requires_one_of = { { mss::DeviceFeature::eAlphaToOne } },
		    .vuids           = { "VUID-VkPipelineMultisampleStateCreateInfo-alphaToOneEnable-00785" },
		};
		return false;
	}

	return true;
}

// ----------------------------------------------------------------------

static bool mss_multisample_state_validate( mss_multisample_state_o const* self, mss_device_caps_query_t const* device, mss_validation_error_t* error ) {

	mss_validation_error_t local_error{};

	// We always collect the error, even if the caller does not want it, so that we can log it.
	bool result = validate_impl( self, device, &local_error );

	if ( result ) {
		return true;
	}

	if ( *MSS_SETTING_SHOULD_LOG_VALIDATION_ERRORS ) {
		static auto logger = mss::Log( LOGGER_LABEL );
		logger.warn( "Invalid multisample state: %s", mss::to_string( local_error ).c_str() );
	}

	if ( error ) {
		*error = std::move( local_error );
	}

	return false;
}

// ----------------------------------------------------------------------

MSS_MODULE_REGISTER_IMPL( mss_multisample_state, api ) {
	auto& i = static_cast<mss_multisample_state_api*>( api )->mss_multisample_state_i;

	i.create  = mss_multisample_state_create;
	i.clone   = mss_multisample_state_clone;
	i.destroy = mss_multisample_state_destroy;

	i.set_rasterization_samples    = mss_multisample_state_set_rasterization_samples;
	i.get_rasterization_samples    = mss_multisample_state_get_rasterization_samples;
	i.set_sample_shading           = mss_multisample_state_set_sample_shading;
	i.clear_sample_shading         = mss_multisample_state_clear_sample_shading;
	i.get_sample_shading           = mss_multisample_state_get_sample_shading;
	i.set_sample_mask              = mss_multisample_state_set_sample_mask;
	i.get_sample_mask              = mss_multisample_state_get_sample_mask;
	i.set_alpha_to_coverage_enable = mss_multisample_state_set_alpha_to_coverage_enable;
	i.get_alpha_to_coverage_enable = mss_multisample_state_get_alpha_to_coverage_enable;
	i.set_alpha_to_one_enable      = mss_multisample_state_set_alpha_to_one_enable;
	i.get_alpha_to_one_enable      = mss_multisample_state_get_alpha_to_one_enable;

	i.is_equal = mss_multisample_state_is_equal;
	i.get_hash = mss_multisample_state_get_hash;
	i.to_str   = mss_multisample_state_to_str;
	i.validate = mss_multisample_state_validate;
}
