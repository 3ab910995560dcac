#ifndef EVLOOP_HPP
#define EVLOOP_HPP

#include <atomic>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "log.hpp"

using io_service = boost::asio::io_context;

class TunnelProxy;
class FrameEndpoint;

// Process level plumbing: termination signals and fatal endpoint errors
// both lead to an orderly close of the proxy and the endpoints.
class EVLoop {
public:
    EVLoop( io_service &i, Logger &l, TunnelProxy &p, FrameEndpoint &d, FrameEndpoint &s );

    void on_signal( const boost::system::error_code &ec, int signal );
    void on_endpoint_error( const std::string &error );

    int exitCode() const {
        return exit_code;
    }

private:
    void shutdown();

    io_service &io;
    Logger &logger;
    TunnelProxy &proxy;
    FrameEndpoint &discovery;
    FrameEndpoint &session;
    boost::asio::signal_set signals;
    std::atomic_bool interrupted { false };
    int exit_code { 0 };
};

#endif
