#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/*
 * Diagnostics for the codec. Nothing in the encode/decode hot path logs above `Debug`, so the
 * default `Warning` level keeps a well-formed round trip silent.
 *
 * Usage:
 *  nbt::Logger::instance( ).set_level( nbt::LogLevel::Debug );
 *  nbt::Logger::instance( ).clear_sinks( );
 *  nbt::Logger::instance( ).add_sink( my_sink );
 */

namespace nbt
{
    enum class LogLevel : int
    {
        Trace    = 0,
        Debug    = 1,
        Info     = 2,
        Warning  = 3,
        Error    = 4,
        Critical = 5
    };

    class Logger
    {
    public:
        struct LogEntry
        {
            std::chrono::system_clock::time_point timestamp;
            LogLevel level;
            std::string category;
            std::string message;
        };

        using LogSink = std::function< void( const LogEntry &entry ) >;

        static Logger &instance( );

        void set_level( const LogLevel level )
        {
            std::lock_guard< std::mutex > lock( mutex_ );
            min_level_ = level;
        }

        LogLevel get_level( ) const
        {
            std::lock_guard< std::mutex > lock( mutex_ );
            return min_level_;
        }

        void add_sink( LogSink sink )
        {
            std::lock_guard< std::mutex > lock( mutex_ );
            sinks_.push_back( std::move( sink ) );
        }

        void clear_sinks( )
        {
            std::lock_guard< std::mutex > lock( mutex_ );
            sinks_.clear ( );
        }

        bool is_enabled( const LogLevel level ) const
        {
            std::lock_guard< std::mutex > lock( mutex_ );
            return level >= min_level_;
        }

        /**
         * @brief Hand a finished message to every registered sink.
         * @param level Severity of the message
         * @param category Short subsystem tag, e.g. "reader" or "gzip"
         * @param message Fully formatted text
         */
        void log( const LogLevel level, const std::string_view category, const std::string_view message )
        {
            if ( !is_enabled( level ) )
                return;

            const LogEntry entry {
                std::chrono::system_clock::now ( ),
                level,
                std::string( category ),
                std::string( message )
            };

            std::lock_guard< std::mutex > lock( mutex_ );

            for ( const auto &sink : sinks_ )
                sink( entry );
        }

        /**
         * @brief Substitute each `{}` in `format` with the next argument, then log the result.
         */
        template < typename... Args >
        void log_formatted( const LogLevel level, const std::string_view category, const std::string_view format, Args &&...args )
        {
            if ( !is_enabled( level ) )
                return;

            log( level, category, format_message( format, std::forward< Args >( args )... ) );
        }

        static std::string level_to_string( const LogLevel level )
        {
            switch ( level )
            {
            case LogLevel::Trace:
                return "TRACE";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Critical:
                return "CRITICAL";
            }

            return "UNKNOWN";
        }

        static std::string timestamp_to_string( const std::chrono::system_clock::time_point &tp )
        {
            const auto time = std::chrono::system_clock::to_time_t( tp );
            const auto ms = std::chrono::duration_cast< std::chrono::milliseconds >( tp.time_since_epoch ( ) ) % 1000;

            std::tm local { };
#ifdef _MSC_VER
            localtime_s( &local, &time );
#else
            localtime_r( &time, &local );
#endif

            std::ostringstream ss;
            ss << std::put_time( &local, "%Y-%m-%d %H:%M:%S" );
            ss << '.' << std::setfill( '0' ) << std::setw( 3 ) << ms.count ( );

            return ss.str ( );
        }

    private:
        Logger( );
        ~Logger( ) = default;

        Logger( const Logger & ) = delete;
        Logger &operator=( const Logger & ) = delete;

        template < typename Ty >
        static std::string arg_to_string( Ty &&value )
        {
            using D = std::decay_t< Ty >;

            if constexpr ( std::is_same_v< D, std::string > )
                return value;
            else if constexpr ( std::is_same_v< D, std::string_view > )
                return std::string( value );
            else if constexpr ( std::is_same_v< D, const char * > || std::is_same_v< D, char * > )
                return value ? std::string( value ) : std::string( "(null)" );
            else if constexpr ( std::is_same_v< D, bool > )
                return value ? "true" : "false";
            else if constexpr ( std::is_same_v< D, char > || std::is_same_v< D, signed char > || std::is_same_v< D, unsigned char > )
                return std::to_string( static_cast< int >( value ) );
            else
                return std::to_string( value );
        }

        template < typename... Args >
        static std::string format_message( const std::string_view format, Args &&...args )
        {
            std::string result( format );
            std::string::size_type from = 0;

            const auto replace_next = [ & ]( std::string text )
            {
                const auto pos = result.find( "{}", from );

                if ( pos == std::string::npos )
                    return;

                result.replace( pos, 2, text );
                from = pos + text.size ( );
            };

            ( replace_next( arg_to_string( std::forward< Args >( args ) ) ), ... );

            return result;
        }

        mutable std::mutex mutex_;
        LogLevel min_level_ { LogLevel::Warning };
        std::vector< LogSink > sinks_;
    };

    namespace sinks
    {
        /**
         * @brief Write `timestamp LEVEL [category] message` lines to stderr.
         */
        inline Logger::LogSink console_sink( )
        {
            return []( const Logger::LogEntry &entry )
            {
                std::cerr << Logger::timestamp_to_string( entry.timestamp ) << " "
                          << Logger::level_to_string( entry.level ) << " "
                          << "[" << entry.category << "] " << entry.message << std::endl;
            };
        }

        inline Logger::LogSink null_sink( )
        {
            return []( const Logger::LogEntry & ) { };
        }
    }

    inline Logger::Logger( )
    {
        sinks_.push_back( sinks::console_sink ( ) );
    }

    inline Logger &Logger::instance( )
    {
        static Logger logger;
        return logger;
    }
}

#define NBT_LOG_AT( lvl, category, ... )                                                   \
    do                                                                                     \
    {                                                                                      \
        if ( ::nbt::Logger::instance ( ).is_enabled( lvl ) )                               \
        {                                                                                  \
            ::nbt::Logger::instance ( ).log_formatted( lvl, category, __VA_ARGS__ );       \
        }                                                                                  \
    } while ( 0 )

#define NBT_LOG_TRACE( category, ... ) NBT_LOG_AT( ::nbt::LogLevel::Trace, category, __VA_ARGS__ )
#define NBT_LOG_DEBUG( category, ... ) NBT_LOG_AT( ::nbt::LogLevel::Debug, category, __VA_ARGS__ )
#define NBT_LOG_INFO( category, ... ) NBT_LOG_AT( ::nbt::LogLevel::Info, category, __VA_ARGS__ )
#define NBT_LOG_WARN( category, ... ) NBT_LOG_AT( ::nbt::LogLevel::Warning, category, __VA_ARGS__ )
#define NBT_LOG_ERROR( category, ... ) NBT_LOG_AT( ::nbt::LogLevel::Error, category, __VA_ARGS__ )
#define NBT_LOG_CRITICAL( category, ... ) NBT_LOG_AT( ::nbt::LogLevel::Critical, category, __VA_ARGS__ )
