#ifndef GUARD_MSS_CORE_H
#define GUARD_MSS_CORE_H

#include <stdint.h>
#include <stddef.h> // for size_t

/*

  The core owns everything which must exist exactly once per process:

  - the api table of every module, indexed by a hash of the module's name,
  - a key -> pointer dictionary for module singletons,
  - the settings store behind MSS_SETTING.

  A module's api table is filled in by the module's register function, the
  first time any compilation unit asks for it.

*/

#ifdef __cplusplus
#	define MSS_API_ATTR extern "C"
#else
#	define MSS_API_ATTR
#endif

MSS_API_ATTR void* mss_core_load_module_static( char const* module_name, void ( *module_reg_fun )( void* ), uint64_t api_size_in_bytes );

// Returns the address of the slot for `key`, creating an empty (nullptr) slot on first use.
// The address stays valid until the process ends.
MSS_API_ATTR void** mss_core_produce_dictionary_entry( uint64_t key );

// Returns the address of the object pointer of setting `name`, creating the entry on first use.
// `type_name` is the setting's type as spelled in MSS_SETTING; it must be the same for every declaration.
MSS_API_ATTR void** mss_core_produce_setting_entry( char const* name, char const* type_name );

namespace mss {

// MSS_SETTING allocates the non-const type, so that const settings can be given their value once.
template <typename T>
struct rm_const {
	using type = T;
};

template <typename T>
struct rm_const<T const> {
	using type = T;
};

} // namespace mss

//----------------------------------------------------------------------

// Settings are created on first use, with their default value. Any later
// declaration of a setting with the same name will point to the same object.
#define MSS_SETTING( SETTING_TYPE, SETTING_NAME, SETTING_DEFAULT_VALUE )                \
	static SETTING_TYPE* SETTING_NAME = []() -> SETTING_TYPE* {                         \
		void** p_addr = mss_core_produce_setting_entry( #SETTING_NAME, #SETTING_TYPE ); \
		if ( nullptr == *p_addr ) {                                                     \
			*p_addr = new mss::rm_const<SETTING_TYPE>::type( SETTING_DEFAULT_VALUE );   \
		}                                                                               \
		return ( ( SETTING_TYPE* )( *p_addr ) );                                        \
	}()

// Copies all setting entries into `settings_map_ptr`, and writes a fingerprint of the set of
// declared settings to `hash_p`. Either may be nullptr.
MSS_API_ATTR void mss_core_copy_settings_entries( struct mss_settings_map_t* settings_map_ptr, uint64_t* hash_p );
// Returns nullptr if no setting called `setting_name` has been declared.
MSS_API_ATTR struct MssSettingEntry* mss_core_get_setting_entry( char const* setting_name );

// ---------- module macros
//
// A module header declares its api struct `x_api`, then uses MSS_MODULE(x) to declare the
// register function and MSS_MODULE_LOAD(x) to get a pointer `x_api_i` to the filled-in api.
// The module's .cpp defines the register function with MSS_MODULE_REGISTER_IMPL(x, api).

#define MSS_MODULE( x ) \
	MSS_API_ATTR void mss_module_register_##x( void* )

#define MSS_MODULE_REGISTER_IMPL( x, api ) \
	MSS_API_ATTR void mss_module_register_##x( void* api )

#define MSS_MODULE_LOAD( x )                                                                 \
	static x##_api const* x##_api_i = static_cast<x##_api const*>( mss_core_load_module_static( \
	    #x, mss_module_register_##x, sizeof( x##_api ) ) )

#ifdef __cplusplus

// Inherit from these to delete copy or move operations of a wrapper class.

struct NoCopy {
	NoCopy()                           = default;
	NoCopy( NoCopy const& )            = delete;
	NoCopy& operator=( NoCopy const& ) = delete;

  protected:
	~NoCopy() = default;
};

struct NoMove {
	NoMove()                      = default;
	NoMove( NoMove&& )            = delete;
	NoMove& operator=( NoMove&& ) = delete;

  protected:
	~NoMove() = default;
};

#endif // __cplusplus

#endif // GUARD_MSS_CORE_H
