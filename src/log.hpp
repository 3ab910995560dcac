#ifndef LOG_HPP
#define LOG_HPP

#include <cstdint>
#include <iostream>
#include <sstream>
#include <mutex>
#include <string>

enum class LOGL: uint8_t {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    ALERT
};

enum class LOGS: uint8_t {
    MAIN,
    PACKET,
    PPPOED,
    PPPOES,
    TUNNEL,
    LINK
};

std::ostream& operator<<( std::ostream &os, const LOGL &l );
std::ostream& operator<<( std::ostream &os, const LOGS &l );

class Logger;

// One log line, flushed to the logger on std::endl
class LogRecord {
public:
    LogRecord( Logger &l, LOGL level, bool noop );
    LogRecord( LogRecord && ) = default;
    LogRecord( const LogRecord & ) = delete;
    LogRecord& operator=( const LogRecord & ) = delete;

    LogRecord& operator<<( std::ostream& (*fun)( std::ostream& ) );

    template<typename T>
    LogRecord& operator<<( const T& data ) {
        if( !noop ) {
            line << data;
        }
        return *this;
    }

private:
    Logger &logger;
    bool noop;
    std::ostringstream line;
};

class Logger {
public:
    Logger( std::ostream &o = std::cout ):
        os( o ),
        minimum( LOGL::INFO )
    {}

    void setLevel( const LOGL &level ) {
        minimum = level;
    }

    LOGL getLevel() const {
        return minimum;
    }

    LogRecord logTrace() { return record( LOGL::TRACE ); }
    LogRecord logDebug() { return record( LOGL::DEBUG ); }
    LogRecord logInfo() { return record( LOGL::INFO ); }
    LogRecord logWarn() { return record( LOGL::WARN ); }
    LogRecord logError() { return record( LOGL::ERROR ); }
    LogRecord logAlert() { return record( LOGL::ALERT ); }

    void write( const std::string &line );

private:
    LogRecord record( LOGL level ) {
        return LogRecord { *this, level, level < minimum };
    }

    std::ostream &os;
    LOGL minimum;
    std::mutex mutex;
};

#endif
