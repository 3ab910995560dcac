#ifndef PROXY_HPP
#define PROXY_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "config.hpp"
#include "capture.hpp"
#include "link.hpp"
#include "log.hpp"
#include "tunnel.hpp"

using acceptor = boost::asio::ip::tcp::acceptor;
using resolver = boost::asio::ip::tcp::resolver;

// Moves PPPoE frames between the capture endpoints and the tunnel links.
// Server side accepts clients from one allowed address and fans frames out
// to all of them, client side keeps a single upstream link alive.
class TunnelProxy {
public:
    TunnelProxy( io_service &i, Logger &l, const TunnelConf &c, FrameEndpoint &discovery, FrameEndpoint &session, ByteOrder o );
    ~TunnelProxy();

    TunnelProxy( const TunnelProxy& ) = delete;
    TunnelProxy& operator=( const TunnelProxy& ) = delete;

    // Binds the listener (server) or starts dialing (client). Listen errors throw.
    void start();
    void close();

    void forward( TUNNEL_FRAME type, const std::vector<uint8_t> &pkt );

    std::size_t clientCount() const;
    bool isConnected() const;
    uint16_t localPort() const;

private:
    // server side
    void do_accept();
    void on_accept( error_code ec, socket_tcp sock );

    // client side
    void connect();
    void on_resolve( error_code ec, resolver::results_type results );
    void on_connect( error_code ec, std::shared_ptr<socket_tcp> sock );
    void schedule_reconnect();
    void on_reconnect_timer( error_code ec );
    void start_keepalive_timer();
    void on_keepalive_timer( error_code ec );

    void on_frame( const std::shared_ptr<Link> &link, TunnelFrame frame );
    void on_link_closed( const std::shared_ptr<Link> &link, const std::string &reason );

    // Pending handlers may complete after the proxy is gone, they are dropped then
    template<typename Handler>
    auto guarded( Handler &&handler ) {
        return [ token = std::weak_ptr<bool>( alive ), handler = std::forward<Handler>( handler ) ]( auto&&... args ) mutable {
            if( !token.expired() ) {
                handler( std::forward<decltype( args )>( args )... );
            }
        };
    }

    io_service &io;
    Logger &logger;
    TunnelConf conf;
    FrameEndpoint &discovery;
    FrameEndpoint &session;
    ByteOrder order;
    std::string host;
    uint16_t port { 0 };
    std::atomic_bool closed { false };

    acceptor accpt;
    mutable std::shared_mutex clients_mutex;
    std::map<std::string,std::shared_ptr<Link>> clients;

    resolver res;
    mutable std::mutex upstream_mutex;
    std::shared_ptr<Link> upstream;
    uint32_t unanswered_pings { 0 };
    boost::asio::steady_timer reconnect_timer;
    boost::asio::steady_timer keepalive_timer;

    std::shared_ptr<bool> alive { std::make_shared<bool>( true ) };
};

#endif
