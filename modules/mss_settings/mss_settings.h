#ifndef GUARD_mss_settings_H
#define GUARD_mss_settings_H

#include "mss_core.h"

// Sets and lists the values of MSS_SETTING globals by name, so that they can
// be changed from outside the code which declares them.

// clang-format off
struct mss_settings_api {

	struct mss_settings_interface_t {

		// Parses `value` according to the declared type of setting `name`, and stores it.
		//
		// bool:                   "true", "false", "1" or "0"
		// int, int32_t, uint32_t: the whole string must be a number in range; uint32_t
		//                         also accepts hexadecimal ("0x...") and octal ("0...").
		// std::string:            any value
		//
		// Returns false, and leaves the setting unchanged, if the setting does not exist,
		// is const, or `value` cannot be parsed.
		bool ( * set      ) ( char const* name, char const* value );

		// Logs name, type and value of every setting, at info level.
		void ( * log_all  ) ();
	};

	mss_settings_interface_t mss_settings_i;
};
// clang-format on

MSS_MODULE( mss_settings );
MSS_MODULE_LOAD( mss_settings );

#ifdef __cplusplus

namespace mss_settings {
static const auto& api            = mss_settings_api_i;
static const auto& mss_settings_i = api->mss_settings_i;
} // namespace mss_settings

namespace mss {

struct Settings {
	static bool set( char const* name, char const* value ) {
		return mss_settings::mss_settings_i.set( name, value );
	}

	static void list() {
		mss_settings::mss_settings_i.log_all();
	}
};

} // namespace mss

#endif // __cplusplus

#endif
