#include "mss_multisample_state.h"
#include "mss_device_caps.h"
#include "mss_log.h"
#include "mss_settings.h"

#include "TestingHelpers.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

using mss::DeviceFeature;
using mss::MultisampleState;
using mss::SampleCountFlagBits;
using mss::ValidationError;

namespace {

float const SHADING_VALUES[] = {
    -1.f,
    -0.0001f,
    -0.f,
    0.f,
    0.25f,
    0.5f,
    1.f,
    1.0001f,
    2.f,
    std::numeric_limits<float>::infinity(),
    -std::numeric_limits<float>::infinity(),
    std::numeric_limits<float>::quiet_NaN(),
};

bool is_in_unit_range( float value ) {
	return value >= 0.f && value <= 1.f;
}

} // namespace

// ----------------------------------------------------------------------

TEST( MultisampleStateValidation, DefaultStateIsValidOnDeviceWithoutFeatures ) {
	mss::testing::MockDevice device;

	ValidationError error{};
	ASSERT_TRUE( MultisampleState().validate( device.query(), &error ) );
}

TEST( MultisampleStateValidation, DefaultStateIsValidOnDefaultDeviceCaps ) {
	mss::DeviceCaps caps;
	ASSERT_TRUE( MultisampleState().validate( caps ) );
}

TEST( MultisampleStateValidation, SampleShadingWithoutFeatureFails ) {
	mss::testing::MockDevice device;

	MultisampleState state;
	state.setSampleShading( 0.5f );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );

	ASSERT_EQ( error.kind, ValidationError::Kind::eCapabilityRequired );
	ASSERT_EQ( error.context, "sample_shading" );
	ASSERT_EQ( error.problem, "is `Some`" );
	ASSERT_EQ( error.requires_one_of, mss::RequiresOneOf{ { DeviceFeature::eSampleRateShading } } );
	ASSERT_EQ( error.vuids.size(), 1u );
	ASSERT_STREQ( error.vuids[ 0 ], "VUID-VkPipelineMultisampleStateCreateInfo-sampleShadingEnable-00784" );
}

TEST( MultisampleStateValidation, SampleShadingWithFeatureInRangePasses ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	MultisampleState state;
	state.setSampleShading( 0.5f );

	ASSERT_TRUE( state.validate( device.query() ) );
}

TEST( MultisampleStateValidation, SampleShadingBoundariesAreInclusive ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	ASSERT_TRUE( MultisampleState().setSampleShading( 0.f ).validate( device.query() ) );
	ASSERT_TRUE( MultisampleState().setSampleShading( 1.f ).validate( device.query() ) );
}

TEST( MultisampleStateValidation, SampleShadingOutOfRangeFails ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	MultisampleState state;
	state.setSampleShading( 1.5f );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );

	ASSERT_EQ( error.kind, ValidationError::Kind::eValueOutOfRange );
	ASSERT_EQ( error.context, "sample_shading" );
	ASSERT_EQ( error.problem, "is not between 0.0 and 1.0 inclusive" );
	ASSERT_TRUE( error.requires_one_of.empty() );
	ASSERT_EQ( error.vuids.size(), 1u );
	ASSERT_STREQ( error.vuids[ 0 ], "VUID-VkPipelineMultisampleStateCreateInfo-minSampleShading-00786" );
}

TEST( MultisampleStateValidation, SampleShadingNaNFails ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	MultisampleState state;
	state.setSampleShading( std::numeric_limits<float>::quiet_NaN() );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );
	ASSERT_EQ( error.kind, ValidationError::Kind::eValueOutOfRange );
}

TEST( MultisampleStateValidation, SampleShadingPassesIffFeatureEnabledAndValueInRange ) {
	for ( bool feature : { false, true } ) {
		for ( float value : SHADING_VALUES ) {
			mss::testing::MockDevice device;
			device.sample_rate_shading = feature;

			MultisampleState state;
			state.setSampleShading( value );

			bool expected = feature && is_in_unit_range( value );
			ASSERT_EQ( state.validate( device.query() ), expected ) << "feature: " << feature << ", value: " << value;
		}
	}
}

TEST( MultisampleStateValidation, AlphaToOnePassesIffFeatureEnabled ) {
	for ( bool enable : { false, true } ) {
		for ( bool feature : { false, true } ) {
			mss::testing::MockDevice device;
			device.alpha_to_one = feature;

			MultisampleState state;
			state.setAlphaToOneEnable( enable );

			ValidationError error{};
			bool            result = state.validate( device.query(), &error );

			ASSERT_EQ( result, !enable || feature ) << "enable: " << enable << ", feature: " << feature;

			if ( !result ) {
				ASSERT_EQ( error.kind, ValidationError::Kind::eCapabilityRequired );
				ASSERT_EQ( error.context, "alpha_to_one_enable" );
				ASSERT_EQ( error.problem, "is `true`" );
				ASSERT_EQ( error.requires_one_of, mss::RequiresOneOf{ { DeviceFeature::eAlphaToOne } } );
				ASSERT_EQ( error.vuids.size(), 1u );
				ASSERT_STREQ( error.vuids[ 0 ], "VUID-VkPipelineMultisampleStateCreateInfo-alphaToOneEnable-00785" );
			}
		}
	}
}

TEST( MultisampleStateValidation, SampleMaskAndAlphaToCoverageDoNotAffectResult ) {
	uint32_t const masks[][ 2 ] = {
	    { 0x0, 0x0 },
	    { 0x1, 0x0 },
	    { 0xFFFFFFFF, 0xFFFFFFFF },
	    { 0xDEADBEEF, 0x12345678 },
	};

	for ( bool alpha_to_one_feature : { false, true } ) {
		mss::testing::MockDevice device;
		device.alpha_to_one = alpha_to_one_feature;

		MultisampleState reference;
		reference.setAlphaToOneEnable( true );

		ValidationError reference_error{};
		bool            reference_result = reference.validate( device.query(), &reference_error );

		for ( auto const& mask : masks ) {
			for ( bool alpha_to_coverage : { false, true } ) {
				MultisampleState state = reference;
				state.setSampleMask( mask ).setAlphaToCoverageEnable( alpha_to_coverage );

				ValidationError error{};
				ASSERT_EQ( state.validate( device.query(), &error ), reference_result );
				ASSERT_EQ( mss::to_string( error ), mss::to_string( reference_error ) );
			}
		}
	}
}

TEST( MultisampleStateValidation, ValidationIsDeterministic ) {
	mss::testing::MockDevice device;

	MultisampleState state;
	state.setSampleShading( 0.5f ).setAlphaToOneEnable( true );

	ValidationError first{};
	ValidationError second{};

	ASSERT_EQ( state.validate( device.query(), &first ), state.validate( device.query(), &second ) );
	ASSERT_EQ( mss::to_string( first ), mss::to_string( second ) );

	// Validation does not change the state.
	ASSERT_EQ( state.getSampleShading(), 0.5f );
	ASSERT_TRUE( state.getAlphaToOneEnable() );
}

TEST( MultisampleStateValidation, ShadingRangeIsReportedBeforeAlphaToOne ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	MultisampleState state;
	state.setSampleShading( 1.5f ).setAlphaToOneEnable( true );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );
	ASSERT_EQ( error.kind, ValidationError::Kind::eValueOutOfRange );
	ASSERT_EQ( error.context, "sample_shading" );
}

TEST( MultisampleStateValidation, ShadingCapabilityIsReportedBeforeShadingRange ) {
	mss::testing::MockDevice device;

	MultisampleState state;
	state.setSampleShading( 1.5f );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );
	ASSERT_EQ( error.kind, ValidationError::Kind::eCapabilityRequired );
	ASSERT_EQ( error.context, "sample_shading" );
}

// ----------------------------------------------------------------------
// End to end scenarios

TEST( MultisampleStateValidation, FourSamplesOnMinimalDevicePasses ) {
	mss::testing::MockDevice device;
	device.supported_sample_counts = SampleCountFlagBits::e1 | SampleCountFlagBits::e4;

	MultisampleState state;
	state.setRasterizationSamples( SampleCountFlagBits::e4 );

	ASSERT_TRUE( state.validate( device.query() ) );
}

TEST( MultisampleStateValidation, FullSampleShadingWithFeaturePasses ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading     = true;
	device.supported_sample_counts = SampleCountFlagBits::e1 | SampleCountFlagBits::e4;

	MultisampleState state;
	state.setRasterizationSamples( SampleCountFlagBits::e4 ).setSampleShading( 1.f );

	ASSERT_TRUE( state.validate( device.query() ) );
}

TEST( MultisampleStateValidation, AlphaToOneOnDeviceWithoutFeatureFails ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	MultisampleState state;
	state.setAlphaToOneEnable( true );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );
	ASSERT_EQ( mss::to_string( error ),
	           "alpha_to_one_enable: is `true` -- requires one of: [device feature `alpha_to_one`] "
	           "(VUID-VkPipelineMultisampleStateCreateInfo-alphaToOneEnable-00785)" );
}

TEST( MultisampleStateValidation, ShadingAboveOneFailsAsValueError ) {
	mss::testing::MockDevice device;
	device.sample_rate_shading = true;

	MultisampleState state;
	state.setSampleShading( 2.f );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );
	ASSERT_EQ( error.kind, ValidationError::Kind::eValueOutOfRange );
}

TEST( MultisampleStateValidation, UnsupportedSampleCountIsReportedFirst ) {
	mss::testing::MockDevice device;
	device.supported_sample_counts = SampleCountFlagBits::e1 | SampleCountFlagBits::e4;

	// Every other field is invalid too - the sample count wins.
	MultisampleState state;
	state.setRasterizationSamples( SampleCountFlagBits::e8 ).setSampleShading( 5.f ).setAlphaToOneEnable( true );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );

	ASSERT_EQ( error.kind, ValidationError::Kind::eUnsupportedSampleCount );
	ASSERT_EQ( error.context, "rasterization_samples" );
	ASSERT_EQ( error.problem, "is 8, which is not supported by the device (supported sample counts: 1, 4)" );
	ASSERT_TRUE( error.requires_one_of.empty() );
	ASSERT_EQ( error.vuids.size(), 1u );
	ASSERT_STREQ( error.vuids[ 0 ], "VUID-VkPipelineMultisampleStateCreateInfo-rasterizationSamples-parameter" );
}

TEST( MultisampleStateValidation, InvalidSampleCountValueFails ) {
	mss::testing::MockDevice device;
	device.supported_sample_counts = 0x7f;

	MultisampleState state;
	state.setRasterizationSamples( SampleCountFlagBits( 3 ) );

	ValidationError error{};
	ASSERT_FALSE( state.validate( device.query(), &error ) );
	ASSERT_EQ( error.kind, ValidationError::Kind::eUnsupportedSampleCount );
	ASSERT_EQ( error.problem, "is not a valid sample count value" );
}

// ----------------------------------------------------------------------

TEST( MultisampleStateValidation, ErrorOutputIsOptional ) {
	mss::testing::MockDevice device;

	MultisampleState state;
	state.setAlphaToOneEnable( true );

	ASSERT_FALSE( state.validate( device.query(), nullptr ) );
	ASSERT_FALSE( state.validate( device.query() ) );
}

TEST( MultisampleStateValidation, FeaturesAreNotQueriedIfNotNeeded ) {
	mss::testing::MockDevice device;

	ASSERT_TRUE( MultisampleState().validate( device.query() ) );
	ASSERT_EQ( device.num_feature_queries, 0u );
}

TEST( MultisampleStateValidation, DeviceCapsAndQueryAgree ) {
	mss::DeviceCaps caps;
	caps.setFeatureEnabled( DeviceFeature::eSampleRateShading ).setReadonly();

	mss::testing::MockDevice device;
	device.sample_rate_shading     = true;
	device.supported_sample_counts = caps.getSupportedSampleCounts();

	MultisampleState state;
	state.setRasterizationSamples( SampleCountFlagBits::e4 ).setSampleShading( 0.5f );

	ASSERT_TRUE( state.validate( caps ) );
	ASSERT_TRUE( state.validate( device.query() ) );

	state.setAlphaToOneEnable( true );

	ValidationError caps_error{};
	ValidationError device_error{};
	ASSERT_FALSE( state.validate( caps, &caps_error ) );
	ASSERT_FALSE( state.validate( device.query(), &device_error ) );
	ASSERT_EQ( mss::to_string( caps_error ), mss::to_string( device_error ) );
}

TEST( MultisampleStateValidation, ValidationErrorsAreLoggedIfRequested ) {
	mss::testing::CapturedLogLines captured;

	uint64_t handle = mss_log::api->add_subscriber( mss::testing::CaptureLogLines, &captured, uint32_t( mss::Log::Level::eWarn ) );

	mss::testing::MockDevice device;

	MultisampleState state;
	state.setAlphaToOneEnable( true );

	// Logging is off by default.
	ASSERT_FALSE( state.validate( device.query() ) );
	ASSERT_FALSE( captured.contains( "alpha_to_one_enable" ) );

	ASSERT_TRUE( mss::Settings::set( "MSS_SETTING_SHOULD_LOG_VALIDATION_ERRORS", "1" ) );
	ASSERT_FALSE( state.validate( device.query() ) );
	ASSERT_TRUE( mss::Settings::set( "MSS_SETTING_SHOULD_LOG_VALIDATION_ERRORS", "0" ) );

	mss_log::api->remove_subscriber( handle );

	ASSERT_TRUE( captured.contains( "mss_multisample_state" ) );
	ASSERT_TRUE( captured.contains( "Invalid multisample state: alpha_to_one_enable: is `true`" ) );
}
