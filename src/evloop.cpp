#include <csignal>
#include <functional>

#include <boost/asio/post.hpp>

#include "evloop.hpp"
#include "capture.hpp"
#include "proxy.hpp"

EVLoop::EVLoop( io_service &i, Logger &l, TunnelProxy &p, FrameEndpoint &d, FrameEndpoint &s ):
    io( i ),
    logger( l ),
    proxy( p ),
    discovery( d ),
    session( s ),
    signals( i, SIGTERM, SIGINT )
{
    signals.async_wait( std::bind( &EVLoop::on_signal, this, std::placeholders::_1, std::placeholders::_2 ) );
}

void EVLoop::on_signal( const boost::system::error_code &ec, int signal ) {
    if( ec ) {
        return;
    }
    switch( signal ) {
    case SIGTERM:
    case SIGINT:
        logger.logInfo() << LOGS::MAIN << "Got signal to exit, shutting down..." << std::endl;
        shutdown();
        return;
    default:
        break;
    }
    signals.async_wait( std::bind( &EVLoop::on_signal, this, std::placeholders::_1, std::placeholders::_2 ) );
}

// Capture endpoints are not restarted, losing one ends the process
void EVLoop::on_endpoint_error( const std::string &error ) {
    boost::asio::post( io, [ this, error ]() {
        logger.logAlert() << LOGS::MAIN << error << ", exiting" << std::endl;
        exit_code = 1;
        shutdown();
    });
}

void EVLoop::shutdown() {
    if( interrupted.exchange( true ) ) {
        return;
    }
    proxy.close();
    discovery.close();
    session.close();

    boost::system::error_code ec;
    signals.cancel( ec );
    io.stop();
}
