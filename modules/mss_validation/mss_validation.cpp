#include "mss_validation.h"

#include <cstring> // for memcpy
#include <string>

// ----------------------------------------------------------------------
// Renders a list of alternatives as:
//
//     [device feature `a` and device feature `b`] or [device feature `c`]
//
static void append_requires_one_of( std::string& str, mss::RequiresOneOf const& requires_one_of ) {

	for ( size_t i = 0; i != requires_one_of.size(); i++ ) {

		if ( i != 0 ) {
			str += " or ";
		}

		str += "[";

		auto const& all_of = requires_one_of[ i ];

		for ( size_t j = 0; j != all_of.size(); j++ ) {
			if ( j != 0 ) {
				str += " and ";
			}
			str += "device feature `";
			str += mss::to_str( all_of[ j ] );
			str += "`";
		}

		str += "]";
	}
}

// ----------------------------------------------------------------------

static bool mss_validation_error_format( mss_validation_error_t const* error, char* buffer, size_t* buffer_size ) {

	if ( nullptr == error || nullptr == buffer_size ) {
		return false;
	}

	std::string str = error->context;
	str += ": ";
	str += error->problem;

	if ( !error->requires_one_of.empty() ) {
		str += " -- requires one of: ";
		append_requires_one_of( str, error->requires_one_of );
	}

	if ( !error->vuids.empty() ) {
		str += " (";
		for ( size_t i = 0; i != error->vuids.size(); i++ ) {
			if ( i != 0 ) {
				str += ", ";
			}
			str += error->vuids[ i ];
		}
		str += ")";
	}

	size_t num_bytes_required = str.size() + 1; // include terminating zero

	if ( nullptr == buffer || *buffer_size < num_bytes_required ) {
		*buffer_size = num_bytes_required;
		return false;
	}

	// ---------| invariant: buffer is large enough to hold str including terminating zero

	memcpy( buffer, str.c_str(), num_bytes_required );
	*buffer_size = num_bytes_required;

	return true;
}

// ----------------------------------------------------------------------

static void mss_validation_error_from_requirement( mss_validation_error_t* error, mss_validation_error_t::Kind kind, mss::RequirementNotMet const* requirement ) {
	*error                 = {};
	error->kind            = kind;
	error->problem         = requirement->required_for;
	error->requires_one_of = requirement->requires_one_of;
}

// ----------------------------------------------------------------------

MSS_MODULE_REGISTER_IMPL( mss_validation, api ) {
	auto& i = static_cast<mss_validation_api*>( api )->mss_validation_error_i;

	i.format           = mss_validation_error_format;
	i.from_requirement = mss_validation_error_from_requirement;
}
