#include "mss_settings.h"
#include "mss_core.h"
#include "mss_hash_util.h"
#include "mss_log.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

#include "private/mss_core/mss_settings_private_types.inl"

static constexpr auto LOGGER_LABEL = "mss_settings";

// ----------------------------------------------------------------------

static bool parse_bool( char const* str, bool* result ) {
	if ( 0 == strcmp( str, "true" ) || 0 == strcmp( str, "1" ) ) {
		*result = true;
		return true;
	}
	if ( 0 == strcmp( str, "false" ) || 0 == strcmp( str, "0" ) ) {
		*result = false;
		return true;
	}
	return false;
}

// ----------------------------------------------------------------------
// The whole of `str` must be a decimal number within [min_value, max_value].
static bool parse_signed( char const* str, long long min_value, long long max_value, long long* result ) {
	char* end = nullptr;
	errno     = 0;

	long long value = std::strtoll( str, &end, 10 );

	if ( end == str || *end != '\0' || errno == ERANGE || value < min_value || value > max_value ) {
		return false;
	}

	*result = value;
	return true;
}

// ----------------------------------------------------------------------
// Base 0, so that masks may be given in hexadecimal.
static bool parse_uint32( char const* str, uint32_t* result ) {
	char* end = nullptr;
	errno     = 0;

	// strtoull would accept, and negate, a leading minus sign.
	if ( strchr( str, '-' ) ) {
		return false;
	}

	unsigned long long value = std::strtoull( str, &end, 0 );

	if ( end == str || *end != '\0' || errno == ERANGE || value > std::numeric_limits<uint32_t>::max() ) {
		return false;
	}

	*result = uint32_t( value );
	return true;
}

// ----------------------------------------------------------------------

static bool mss_settings_set( char const* name, char const* value ) {
	static auto logger = mss::Log( LOGGER_LABEL );

	if ( nullptr == name || nullptr == value ) {
		return false;
	}

	MssSettingEntry* entry = mss_core_get_setting_entry( name );

	if ( nullptr == entry || nullptr == entry->p_opj ) {
		logger.warn( "Cannot set '%s': no such setting", name );
		return false;
	}

	bool parsed = false;

	switch ( entry->type_hash ) {
	case SettingType::eBool: {
		bool v = false;
		if ( ( parsed = parse_bool( value, &v ) ) ) {
			*static_cast<bool*>( entry->p_opj ) = v;
		}
	} break;
	case SettingType::eInt: {
		long long v = 0;
		if ( ( parsed = parse_signed( value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), &v ) ) ) {
			*static_cast<int*>( entry->p_opj ) = int( v );
		}
	} break;
	case SettingType::eInt32_t: {
		long long v = 0;
		if ( ( parsed = parse_signed( value, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max(), &v ) ) ) {
			*static_cast<int32_t*>( entry->p_opj ) = int32_t( v );
		}
	} break;
	case SettingType::eUint32_t: {
		uint32_t v = 0;
		if ( ( parsed = parse_uint32( value, &v ) ) ) {
			*static_cast<uint32_t*>( entry->p_opj ) = v;
		}
	} break;
	case SettingType::eStdString:
		*static_cast<std::string*>( entry->p_opj ) = value;
		parsed                                     = true;
		break;
	default:
		logger.warn( "Cannot set '%s': setting is const", name );
		return false;
	}

	if ( !parsed ) {
		logger.warn( "Cannot set '%s': could not parse value '%s'", name, value );
	}

	return parsed;
}

// ----------------------------------------------------------------------

static void mss_settings_log_all() {
	static auto logger = mss::Log( LOGGER_LABEL );

	mss_settings_map_t settings;
	mss_core_copy_settings_entries( &settings, nullptr );

	for ( auto const& [ hash, entry ] : settings.map ) {
		void const* p = entry.p_opj;
		if ( nullptr == p ) {
			continue;
		}
		char const* name = entry.name.c_str();

		switch ( entry.type_hash ) {
		case SettingType::eBool:
		case SettingType::eConstBool:
			logger.info( "%s (bool) = %s", name, *static_cast<bool const*>( p ) ? "true" : "false" );
			break;
		case SettingType::eInt:
			logger.info( "%s (int) = %d", name, *static_cast<int const*>( p ) );
			break;
		case SettingType::eInt32_t:
			logger.info( "%s (int32_t) = %d", name, *static_cast<int32_t const*>( p ) );
			break;
		case SettingType::eUint32_t:
			logger.info( "%s (uint32_t) = 0x%x", name, *static_cast<uint32_t const*>( p ) );
			break;
		case SettingType::eStdString:
			logger.info( "%s (std::string) = '%s'", name, static_cast<std::string const*>( p )->c_str() );
			break;
		default:
			logger.warn( "%s has a type which cannot be printed", name );
			break;
		}
	}
}

// ----------------------------------------------------------------------

MSS_MODULE_REGISTER_IMPL( mss_settings, api ) {
	auto& i = static_cast<mss_settings_api*>( api )->mss_settings_i;

	i.set     = mss_settings_set;
	i.log_all = mss_settings_log_all;
}
