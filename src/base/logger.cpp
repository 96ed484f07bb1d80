#include "base/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createStdoutLogger( const std::string &tag )
    {
        auto logger = spdlog::stdout_color_mt( tag );
        setGlobalPattern( *logger );
        logger->set_level( spdlog::get_level() );
        return logger;
    }
} // namespace

namespace masumi::base
{
    Logger createLogger( const std::string &tag )
    {
        static std::mutex           mutex;
        std::lock_guard<std::mutex> lock( mutex );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createStdoutLogger( tag );
        }
        return logger;
    }

    bool setLogLevel( const std::string &level )
    {
        auto parsed = spdlog::level::from_str( level );
        if ( parsed == spdlog::level::off && level != "off" )
        {
            return false;
        }
        spdlog::set_level( parsed );
        return true;
    }
} // namespace masumi::base
