#ifndef GUARD_mss_log_H
#define GUARD_mss_log_H

#include "mss_core.h"

/*

  Channel logger.

  Each line is formatted once, as `[ <channel> | <LEVEL> ] <message>`, and then
  handed to every subscriber whose level mask contains the line's level. Two
  subscribers are installed when the module is loaded: one which prints debug,
  info and warn lines to stdout, and one which prints error lines to stderr.

*/

struct mss_log_channel_o;

// clang-format off
struct mss_log_api {

	// Levels are bit flags, so that subscribers can ask for any combination of them.
	enum class Level : uint32_t {
		eDebug = 1 << 0,
		eInfo  = 1 << 1,
		eWarn  = 1 << 2,
		eError = 1 << 3,
	};

	// `chars` is only valid for the duration of the call, and is not zero-terminated.
	typedef void ( *fn_subscriber )( char* chars, uint32_t num_chars, void* user_data );

	// Returns a non-zero handle, which identifies the subscriber for remove_subscriber.
	uint64_t            ( * add_subscriber    ) ( fn_subscriber subscriber, void* user_data, uint32_t level_mask );
	void                ( * remove_subscriber ) ( uint64_t handle );

	// nullptr or "" return the default channel. Channels live until the process ends.
	mss_log_channel_o * ( * get_channel       ) ( char const* name );

	struct mss_log_channel_interface_t {
		// Lines below `level` are dropped before they are formatted.
		void ( * set_level ) ( mss_log_channel_o* channel, Level level );
		void ( * print     ) ( mss_log_channel_o const* channel, Level level, char const* fmt, ... );
	};

	mss_log_channel_interface_t mss_log_channel_i;
};
// clang-format on

MSS_MODULE( mss_log );
MSS_MODULE_LOAD( mss_log );

#ifdef __cplusplus

namespace mss_log {
static const auto& api               = mss_log_api_i;
static const auto& mss_log_channel_i = api->mss_log_channel_i;
} // namespace mss_log

// Combines levels into a subscriber level mask.
constexpr uint32_t operator|( mss_log_api::Level const& lhs, mss_log_api::Level const& rhs ) noexcept {
	return uint32_t( lhs ) | uint32_t( rhs );
}

constexpr uint32_t operator|( uint32_t const& lhs, mss_log_api::Level const& rhs ) noexcept {
	return lhs | uint32_t( rhs );
}

namespace mss {

class Log {
	mss_log_channel_o* channel;

  public:
	using Level = mss_log_api::Level;

	Log()
	    : channel( mss_log::api->get_channel( nullptr ) ) {
	}

	explicit Log( char const* channel_name )
	    : channel( mss_log::api->get_channel( channel_name ) ) {
	}

	void setLevel( Level level ) {
		mss_log::mss_log_channel_i.set_level( channel, level );
	}

	template <typename... Args>
	void debug( char const* fmt, Args&&... args ) {
		mss_log::mss_log_channel_i.print( channel, Level::eDebug, fmt, static_cast<Args&&>( args )... );
	}

	template <typename... Args>
	void info( char const* fmt, Args&&... args ) {
		mss_log::mss_log_channel_i.print( channel, Level::eInfo, fmt, static_cast<Args&&>( args )... );
	}

	template <typename... Args>
	void warn( char const* fmt, Args&&... args ) {
		mss_log::mss_log_channel_i.print( channel, Level::eWarn, fmt, static_cast<Args&&>( args )... );
	}

	template <typename... Args>
	void error( char const* fmt, Args&&... args ) {
		mss_log::mss_log_channel_i.print( channel, Level::eError, fmt, static_cast<Args&&>( args )... );
	}

	mss_log_channel_o* getChannel() const {
		return channel;
	}
};

} // namespace mss

#endif // __cplusplus

#endif
