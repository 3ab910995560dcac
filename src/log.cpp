#include <chrono>
#include <ctime>
#include <iomanip>

#include "log.hpp"

std::ostream& operator<<( std::ostream &os, const LOGL &l ) {
    switch( l ) {
    case LOGL::TRACE: return os << "[TRACE] ";
    case LOGL::DEBUG: return os << "[DEBUG] ";
    case LOGL::INFO: return os << "[INFO] ";
    case LOGL::WARN: return os << "[WARN] ";
    case LOGL::ERROR: return os << "[ERROR] ";
    case LOGL::ALERT: return os << "[ALERT] ";
    }
    return os;
}

std::ostream& operator<<( std::ostream &os, const LOGS &l ) {
    switch( l ) {
    case LOGS::MAIN: return os << "[MAIN] ";
    case LOGS::PACKET: return os << "[PACKET] ";
    case LOGS::PPPOED: return os << "[PPPOED] ";
    case LOGS::PPPOES: return os << "[PPPOES] ";
    case LOGS::TUNNEL: return os << "[TUNNEL] ";
    case LOGS::LINK: return os << "[LINK] ";
    }
    return os;
}

LogRecord::LogRecord( Logger &l, LOGL level, bool n ):
    logger( l ),
    noop( n )
{
    if( noop ) {
        return;
    }
    auto in_time_t = std::chrono::system_clock::to_time_t( std::chrono::system_clock::now() );
    std::tm local;
    localtime_r( &in_time_t, &local );
    line << std::put_time( &local, "%Y-%m-%d %X: " ) << level;
}

LogRecord& LogRecord::operator<<( std::ostream& (*fun)( std::ostream& ) ) {
    if( noop ) {
        return *this;
    }
    if( fun == static_cast<std::ostream& (*)( std::ostream& )>( std::endl ) ) {
        logger.write( line.str() );
        line.str( {} );
        noop = true;
        return *this;
    }
    line << fun;
    return *this;
}

void Logger::write( const std::string &line ) {
    std::lock_guard lg { mutex };
    os << line << std::endl;
}
