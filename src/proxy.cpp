#include <stdexcept>

#include <boost/asio/connect.hpp>

#include "proxy.hpp"
#include "packet.hpp"
#include "string_helpers.hpp"
#include "utils.hpp"

TunnelProxy::TunnelProxy( io_service &i, Logger &l, const TunnelConf &c, FrameEndpoint &d, FrameEndpoint &s, ByteOrder o ):
    io( i ),
    logger( l ),
    conf( c ),
    discovery( d ),
    session( s ),
    order( o ),
    accpt( i ),
    res( i ),
    reconnect_timer( i ),
    keepalive_timer( i )
{
    auto [ h, p, err ] = splitHostPort( conf.address );
    if( !err.empty() ) {
        throw std::invalid_argument( "Incorrect address \"" + conf.address + "\": " + err );
    }
    host = std::move( h );
    port = p;

    discovery.setForward( [ this ]( std::vector<uint8_t> pkt ) {
        forward( TUNNEL_FRAME::DISCOVERY, pkt );
    });
    session.setForward( [ this ]( std::vector<uint8_t> pkt ) {
        forward( TUNNEL_FRAME::SESSION, pkt );
    });
}

TunnelProxy::~TunnelProxy() {
    close();
    discovery.setForward( nullptr );
    session.setForward( nullptr );
}

void TunnelProxy::start() {
    if( !conf.isServer() ) {
        start_keepalive_timer();
        connect();
        return;
    }

    boost::asio::ip::tcp::endpoint listen_on { boost::asio::ip::tcp::v4(), port };
    if( !host.empty() ) {
        listen_on = res.resolve( host, std::to_string( port ) ).begin()->endpoint();
    }

    accpt.open( listen_on.protocol() );
    accpt.set_option( acceptor::reuse_address( true ) );
    accpt.bind( listen_on );
    accpt.listen();

    logger.logInfo() << LOGS::TUNNEL << "Server listening on " << listen_on.address().to_string() << ":" << accpt.local_endpoint().port() << std::endl;
    do_accept();
}

void TunnelProxy::close() {
    if( closed.exchange( true ) ) {
        return;
    }
    logger.logInfo() << LOGS::TUNNEL << "Shutting down tunnel" << std::endl;

    reconnect_timer.cancel();
    keepalive_timer.cancel();
    res.cancel();
    if( accpt.is_open() ) {
        error_code ec;
        accpt.close( ec );
    }

    std::shared_ptr<Link> up;
    {
        std::lock_guard lg { upstream_mutex };
        up = std::move( upstream );
    }
    if( up ) {
        up->close();
    }

    std::map<std::string,std::shared_ptr<Link>> to_close;
    {
        std::unique_lock lg { clients_mutex };
        to_close.swap( clients );
    }
    for( auto const &[ remote, link ]: to_close ) {
        link->close();
    }
}

std::size_t TunnelProxy::clientCount() const {
    std::shared_lock lg { clients_mutex };
    return clients.size();
}

bool TunnelProxy::isConnected() const {
    std::lock_guard lg { upstream_mutex };
    return upstream != nullptr;
}

uint16_t TunnelProxy::localPort() const {
    error_code ec;
    auto const &endpoint = accpt.local_endpoint( ec );
    return ec ? 0 : endpoint.port();
}

void TunnelProxy::forward( TUNNEL_FRAME type, const std::vector<uint8_t> &pkt ) {
    if( closed ) {
        return;
    }

    if( conf.isServer() ) {
        std::shared_lock lg { clients_mutex };
        if( clients.empty() ) {
            return;
        }
        auto encoded = std::make_shared<const std::vector<uint8_t>>( tunnel::encode( type, pkt, order ) );
        for( auto const &[ remote, link ]: clients ) {
            if( !link->send( encoded ) ) {
                logger.logError() << LOGS::TUNNEL << "Error sending " << type << " packet to client " << remote << ": link is closed" << std::endl;
            }
        }
        return;
    }

    std::shared_ptr<Link> link;
    {
        std::lock_guard lg { upstream_mutex };
        link = upstream;
    }
    if( !link ) {
        return;
    }
    if( !link->send( type, pkt ) ) {
        logger.logError() << LOGS::TUNNEL << "Error sending " << type << " packet to server: link is closed" << std::endl;
    }
}

void TunnelProxy::do_accept() {
    accpt.async_accept( guarded( std::bind( &TunnelProxy::on_accept, this, std::placeholders::_1, std::placeholders::_2 ) ) );
}

void TunnelProxy::on_accept( error_code ec, socket_tcp sock ) {
    if( closed || ec == boost::asio::error::operation_aborted ) {
        return;
    }
    if( ec ) {
        logger.logError() << LOGS::TUNNEL << "Error accepting connection: " << ec.message() << std::endl;
        do_accept();
        return;
    }

    error_code rec;
    auto const &remote = sock.remote_endpoint( rec );
    if( rec ) {
        logger.logError() << LOGS::TUNNEL << "Cannot get address of accepted connection: " << rec.message() << std::endl;
        sock.close( rec );
        do_accept();
        return;
    }

    if( !isClientAllowed( conf.allowed_ip, remote ) ) {
        logger.logWarn() << LOGS::TUNNEL << "Rejected connection from unauthorized client: " << endpointIP( remote ) << std::endl;
        sock.close( rec );
        do_accept();
        return;
    }

    auto link = std::make_shared<Link>( std::move( sock ), logger, order );
    logger.logInfo() << LOGS::TUNNEL << "Accepted connection from " << link->remote() << std::endl;

    std::shared_ptr<Link> replaced;
    {
        std::unique_lock lg { clients_mutex };
        auto &slot = clients[ link->remote() ];
        replaced = std::move( slot );
        slot = link;
    }
    if( replaced ) {
        replaced->close();
    }

    link->start(
        guarded( std::bind( &TunnelProxy::on_frame, this, std::placeholders::_1, std::placeholders::_2 ) ),
        guarded( std::bind( &TunnelProxy::on_link_closed, this, std::placeholders::_1, std::placeholders::_2 ) )
    );
    do_accept();
}

void TunnelProxy::connect() {
    if( closed ) {
        return;
    }
    logger.logInfo() << LOGS::TUNNEL << "Connecting to server at " << conf.address << std::endl;
    res.async_resolve( host, std::to_string( port ), guarded( std::bind( &TunnelProxy::on_resolve, this, std::placeholders::_1, std::placeholders::_2 ) ) );
}

void TunnelProxy::on_resolve( error_code ec, resolver::results_type results ) {
    if( closed ) {
        return;
    }
    if( ec ) {
        logger.logError() << LOGS::TUNNEL << "Cannot resolve " << host << ": " << ec.message() << std::endl;
        schedule_reconnect();
        return;
    }
    auto sock = std::make_shared<socket_tcp>( io );
    boost::asio::async_connect( *sock, results, guarded( std::bind( &TunnelProxy::on_connect, this, std::placeholders::_1, sock ) ) );
}

void TunnelProxy::on_connect( error_code ec, std::shared_ptr<socket_tcp> sock ) {
    if( closed ) {
        return;
    }
    if( ec ) {
        logger.logError() << LOGS::TUNNEL << "Failed to connect to server at " << conf.address << ": " << ec.message() << std::endl;
        schedule_reconnect();
        return;
    }

    auto link = std::make_shared<Link>( std::move( *sock ), logger, order );
    std::shared_ptr<Link> stale;
    {
        std::lock_guard lg { upstream_mutex };
        if( closed ) {
            stale = link;
        } else {
            stale = std::move( upstream );
            upstream = link;
            unanswered_pings = 0;
        }
    }
    if( stale ) {
        stale->close();
    }
    if( stale == link ) {
        return;
    }

    logger.logInfo() << LOGS::TUNNEL << "Connected to server at " << link->remote() << std::endl;
    link->start(
        guarded( std::bind( &TunnelProxy::on_frame, this, std::placeholders::_1, std::placeholders::_2 ) ),
        guarded( std::bind( &TunnelProxy::on_link_closed, this, std::placeholders::_1, std::placeholders::_2 ) )
    );
}

void TunnelProxy::schedule_reconnect() {
    if( closed ) {
        return;
    }
    reconnect_timer.expires_after( conf.reconnect_interval );
    reconnect_timer.async_wait( guarded( std::bind( &TunnelProxy::on_reconnect_timer, this, std::placeholders::_1 ) ) );
}

void TunnelProxy::on_reconnect_timer( error_code ec ) {
    if( ec || closed ) {
        return;
    }
    logger.logInfo() << LOGS::TUNNEL << "Attempting to reconnect to server..." << std::endl;
    connect();
}

void TunnelProxy::start_keepalive_timer() {
    keepalive_timer.expires_after( conf.keepalive_interval );
    keepalive_timer.async_wait( guarded( std::bind( &TunnelProxy::on_keepalive_timer, this, std::placeholders::_1 ) ) );
}

void TunnelProxy::on_keepalive_timer( error_code ec ) {
    if( ec || closed ) {
        return;
    }

    std::shared_ptr<Link> link;
    bool lost = false;
    uint32_t missed = 0;
    {
        std::lock_guard lg { upstream_mutex };
        link = upstream;
        missed = unanswered_pings;
        if( link && conf.keepalive_miss_limit > 0 && unanswered_pings >= conf.keepalive_miss_limit ) {
            lost = true;
        } else if( link ) {
            unanswered_pings++;
        }
    }

    if( lost ) {
        logger.logError() << LOGS::TUNNEL << "No pong for " << missed << " pings, dropping connection to " << link->remote() << std::endl;
        link->close();
    } else if( link ) {
        if( link->send( TUNNEL_FRAME::PING, {} ) ) {
            logger.logInfo() << LOGS::TUNNEL << "Sent ping to server" << std::endl;
        } else {
            logger.logError() << LOGS::TUNNEL << "Error sending ping: link is closed" << std::endl;
        }
    }
    start_keepalive_timer();
}

void TunnelProxy::on_frame( const std::shared_ptr<Link> &link, TunnelFrame frame ) {
    auto kind = frame.kind();
    if( !kind.has_value() ) {
        logger.logWarn() << LOGS::TUNNEL << "Unknown packet type from " << link->remote() << ": " << frame.type << std::endl;
        return;
    }

    switch( *kind ) {
    case TUNNEL_FRAME::PING:
        if( !link->send( TUNNEL_FRAME::PONG, {} ) ) {
            logger.logError() << LOGS::TUNNEL << "Error sending pong to " << link->remote() << std::endl;
            return;
        }
        logger.logInfo() << LOGS::TUNNEL << "Received ping from " << link->remote() << ", sent pong" << std::endl;
        break;
    case TUNNEL_FRAME::PONG: {
        logger.logInfo() << LOGS::TUNNEL << "Received pong from " << link->remote() << std::endl;
        std::lock_guard lg { upstream_mutex };
        if( upstream == link ) {
            unanswered_pings = 0;
        }
        break;
    }
    case TUNNEL_FRAME::DISCOVERY:
        discovery.injectPacket( frame.payload );
        break;
    case TUNNEL_FRAME::SESSION:
        session.injectPacket( frame.payload );
        break;
    }
}

void TunnelProxy::on_link_closed( const std::shared_ptr<Link> &link, const std::string &reason ) {
    if( conf.isServer() ) {
        {
            std::unique_lock lg { clients_mutex };
            if( auto const &it = clients.find( link->remote() ); it != clients.end() && it->second == link ) {
                clients.erase( it );
            }
        }
        logger.logInfo() << LOGS::TUNNEL << "Client " << link->remote() << " disconnected: " << reason << std::endl;
        return;
    }

    bool current = false;
    {
        std::lock_guard lg { upstream_mutex };
        if( upstream == link ) {
            upstream.reset();
            current = true;
        }
    }
    logger.logInfo() << LOGS::TUNNEL << "Disconnected from server: " << reason << std::endl;
    if( current && !closed ) {
        schedule_reconnect();
    }
}
