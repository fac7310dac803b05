#include "mss_log.h"
#include "mss_core.h"
#include "mss_hash_util.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

using Level = mss_log_api::Level;

struct mss_log_channel_o {
	std::string           name;
#ifdef NDEBUG
	std::atomic<uint32_t> min_level = uint32_t( Level::eWarn );
#else
	std::atomic<uint32_t> min_level = uint32_t( Level::eInfo );
#endif
};

struct subscriber_t {
	uint64_t                   handle;
	mss_log_api::fn_subscriber fn;
	void*                      user_data;
	uint32_t                   level_mask;
};

struct mss_log_o {
	std::mutex                                                          mtx; // protects channels and subscribers
	std::unordered_map<std::string, std::unique_ptr<mss_log_channel_o>> channels;
	std::vector<subscriber_t>                                           subscribers;
	uint64_t                                                            next_handle = 1;
};

static mss_log_o* self = nullptr;

// ----------------------------------------------------------------------

static char const* level_name( Level level ) {
	switch ( level ) {
	case Level::eDebug:
		return "DEBUG";
	case Level::eInfo:
		return "INFO";
	case Level::eWarn:
		return "WARN";
	case Level::eError:
		return "ERROR";
	}
	return "?";
}

// ----------------------------------------------------------------------

static mss_log_channel_o* mss_log_get_channel( char const* name ) {
	std::string key = ( name && name[ 0 ] ) ? name : "DEFAULT";

	std::scoped_lock lock( self->mtx );

	auto& channel = self->channels[ key ];
	if ( !channel ) {
		channel       = std::make_unique<mss_log_channel_o>();
		channel->name = key;
	}
	return channel.get();
}

// ----------------------------------------------------------------------

static void mss_log_set_level( mss_log_channel_o* channel, Level level ) {
	channel->min_level = uint32_t( level );
}

// ----------------------------------------------------------------------

static void mss_log_print( mss_log_channel_o const* channel, Level level, char const* fmt, ... ) {

	if ( uint32_t( level ) < channel->min_level ) {
		return;
	}

	char const* prefix_fmt = "[ %-25s | %-5s ] ";

	int prefix_len = snprintf( nullptr, 0, prefix_fmt, channel->name.c_str(), level_name( level ) );

	va_list args;
	va_start( args, fmt );

	va_list args_copy;
	va_copy( args_copy, args );
	int msg_len = vsnprintf( nullptr, 0, fmt, args_copy );
	va_end( args_copy );

	if ( prefix_len < 0 || msg_len < 0 ) {
		va_end( args );
		return;
	}

	// One extra byte for the terminating zero, which is removed again below.
	std::string line( size_t( prefix_len ) + size_t( msg_len ) + 1, '\0' );

	snprintf( line.data(), size_t( prefix_len ) + 1, prefix_fmt, channel->name.c_str(), level_name( level ) );
	vsnprintf( line.data() + prefix_len, size_t( msg_len ) + 1, fmt, args );
	va_end( args );

	line.pop_back();

	// Subscribers are called outside the lock, so that they may log themselves.
	std::vector<subscriber_t> subscribers;
	{
		std::scoped_lock lock( self->mtx );
		subscribers = self->subscribers;
	}

	for ( auto const& s : subscribers ) {
		if ( s.level_mask & uint32_t( level ) ) {
			s.fn( line.data(), uint32_t( line.size() ), s.user_data );
		}
	}
}

// ----------------------------------------------------------------------

static uint64_t mss_log_add_subscriber( mss_log_api::fn_subscriber fn, void* user_data, uint32_t level_mask ) {
	std::scoped_lock lock( self->mtx );
	uint64_t         handle = self->next_handle++;
	self->subscribers.push_back( { handle, fn, user_data, level_mask } );
	return handle;
}

// ----------------------------------------------------------------------

static void mss_log_remove_subscriber( uint64_t handle ) {
	std::scoped_lock lock( self->mtx );
	std::erase_if( self->subscribers, [ handle ]( subscriber_t const& s ) { return s.handle == handle; } );
}

// ----------------------------------------------------------------------
// user_data is the FILE* to print to.
static void print_to_file( char* chars, uint32_t num_chars, void* user_data ) {
	auto file = static_cast<FILE*>( user_data );
	fprintf( file, "%.*s\n", int( num_chars ), chars );
	fflush( file );
}

// ----------------------------------------------------------------------

MSS_MODULE_REGISTER_IMPL( mss_log, api ) {
	auto mss_api = static_cast<mss_log_api*>( api );

	mss_api->add_subscriber              = mss_log_add_subscriber;
	mss_api->remove_subscriber           = mss_log_remove_subscriber;
	mss_api->get_channel                 = mss_log_get_channel;
	mss_api->mss_log_channel_i.set_level = mss_log_set_level;
	mss_api->mss_log_channel_i.print     = mss_log_print;

	// One logger per process.
	void** addr = mss_core_produce_dictionary_entry( hash_64_fnv1a_const( "mss_log_o" ) );

	if ( nullptr == *addr ) {
		auto obj = new mss_log_o();
		*addr    = obj;
		self     = obj;
		mss_log_add_subscriber( print_to_file, stdout, Level::eDebug | Level::eInfo | Level::eWarn );
		mss_log_add_subscriber( print_to_file, stderr, uint32_t( Level::eError ) );
	} else {
		self = static_cast<mss_log_o*>( *addr );
	}
}
