#include "mss_core.h"
#include "mss_hash_util.h"

#include <assert.h>
#include <memory>
#include <mutex>
#include <stdlib.h>
#include <string>
#include <unordered_map>

#include "private/mss_core/mss_settings_private_types.inl"

// Api tables are allocated with calloc, so that every function pointer starts out as nullptr.
struct api_table_deleter_t {
	void operator()( void* p ) const {
		free( p );
	}
};

struct api_entry_t {
	std::string                                 name; // for debugging
	std::unique_ptr<void, api_table_deleter_t> table;
};

struct ApiStore {
	std::mutex                                 mtx;
	std::unordered_map<uint64_t, api_entry_t> apis; // hash of module name -> api table
};

// Function-local statics, so that the stores exist before any module's static initialiser asks for them.
static ApiStore& apiStore() {
	static ApiStore obj;
	return obj;
}

// ----------------------------------------------------------------------

MSS_API_ATTR void** mss_core_produce_dictionary_entry( uint64_t key ) {
	static std::mutex                          mtx;
	static std::unordered_map<uint64_t, void*> store;

	std::scoped_lock lock( mtx );
	return &store[ key ]; // node addresses are stable
}

// ----------------------------------------------------------------------

MSS_API_ATTR void* mss_core_load_module_static( char const* module_name, void ( *module_reg_fun )( void* ), uint64_t api_size_in_bytes ) {

	void* table          = nullptr;
	bool  needs_register = false;

	{
		auto&            store = apiStore();
		std::scoped_lock lock( store.mtx );

		auto& entry = store.apis[ hash_64_fnv1a( module_name ) ];

		if ( !entry.table ) {
			void* mem = calloc( 1, api_size_in_bytes );
			assert( mem && "Could not allocate api table" );
			entry.name     = module_name;
			entry.table    = std::unique_ptr<void, api_table_deleter_t>( mem );
			needs_register = true;
		}

		table = entry.table.get();
	}

	// Outside the lock: a register function may load other modules.
	if ( needs_register ) {
		module_reg_fun( table );
	}

	return table;
}

// ----------------------------------------------------------------------

struct SettingsStore {
	std::mutex         mtx;
	mss_settings_map_t settings;
};

static SettingsStore& settingsStore() {
	static SettingsStore obj;
	return obj;
}

// ----------------------------------------------------------------------

MSS_API_ATTR void** mss_core_produce_setting_entry( char const* name, char const* type_name ) {

	auto&            store = settingsStore();
	std::scoped_lock lock( store.mtx );

	uint64_t name_hash = hash_64_fnv1a( name );

	auto it = store.settings.map.find( name_hash );

	if ( it == store.settings.map.end() ) {
		MssSettingEntry entry{
		    .name      = name,
		    .type_hash = hash_64_fnv1a( type_name ),
		    .p_opj     = nullptr,
		};
		it = store.settings.map.emplace( name_hash, std::move( entry ) ).first;
	} else {
		assert( it->second.type_hash == hash_64_fnv1a( type_name ) && "Setting was declared with different types" );
	}

	// Entries in an unordered_map have stable addresses.
	return &it->second.p_opj;
}

// ----------------------------------------------------------------------

MSS_API_ATTR void mss_core_copy_settings_entries( mss_settings_map_t* settings_map_ptr, uint64_t* hash_p ) {

	auto&            store = settingsStore();
	std::scoped_lock lock( store.mtx );

	if ( settings_map_ptr ) {
		*settings_map_ptr = store.settings;
	}

	if ( hash_p ) {
		// Hash is order-independent: we xor the hashes of all entries.
		uint64_t hash = 0;
		for ( auto const& e : store.settings.map ) {
			hash ^= hash_64_fnv1a_bytes( &e.second.type_hash, sizeof( uint64_t ), e.first );
		}
		*hash_p = hash;
	}
}

// ----------------------------------------------------------------------

MSS_API_ATTR MssSettingEntry* mss_core_get_setting_entry( char const* setting_name ) {

	if ( nullptr == setting_name ) {
		return nullptr;
	}

	auto&            store = settingsStore();
	std::scoped_lock lock( store.mtx );

	auto it = store.settings.map.find( hash_64_fnv1a( setting_name ) );

	if ( it == store.settings.map.end() ) {
		return nullptr;
	}

	return &it->second;
}
