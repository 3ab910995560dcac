#include <boost/asio/dispatch.hpp>
#include <boost/asio/write.hpp>

#include "link.hpp"
#include "utils.hpp"

Link::Link( socket_tcp s, Logger &l, ByteOrder o ):
    sock( std::move( s ) ),
    logger( l ),
    order( o ),
    parser( o )
{
    error_code ec;
    auto const &endpoint = sock.remote_endpoint( ec );
    if( ec ) {
        remote_addr = "unknown";
    } else if( endpoint.address().is_v6() && !endpoint.address().to_v6().is_v4_mapped() ) {
        remote_addr = "[" + endpointIP( endpoint ) + "]:" + std::to_string( endpoint.port() );
    } else {
        remote_addr = endpointIP( endpoint ) + ":" + std::to_string( endpoint.port() );
    }
}

Link::~Link() {
    logger.logDebug() << LOGS::LINK << "Link " << remote_addr << " destroyed" << std::endl;
}

void Link::start( FrameHandler frame_handler, CloseHandler close_handler ) {
    on_frame = std::move( frame_handler );
    on_close = std::move( close_handler );
    do_read();
}

bool Link::isOpen() const {
    std::lock_guard lg { write_mutex };
    return !closed;
}

bool Link::send( TUNNEL_FRAME type, const std::vector<uint8_t> &payload ) {
    return send( std::make_shared<const std::vector<uint8_t>>( tunnel::encode( type, payload, order ) ) );
}

bool Link::send( std::shared_ptr<const std::vector<uint8_t>> encoded ) {
    bool start_write = false;
    {
        std::lock_guard lg { write_mutex };
        if( closed ) {
            return false;
        }
        tx_queue.push_back( std::move( encoded ) );
        start_write = tx_queue.size() == 1;
    }
    if( start_write ) {
        boost::asio::dispatch( sock.get_executor(), std::bind( &Link::do_write, shared_from_this() ) );
    }
    return true;
}

void Link::close() {
    {
        std::lock_guard lg { write_mutex };
        closed = true;
    }
    boost::asio::dispatch( sock.get_executor(), std::bind( &Link::shutdown, shared_from_this() ) );
}

void Link::do_read() {
    sock.async_read_some( boost::asio::buffer( buffer ), std::bind( &Link::on_receive, shared_from_this(), std::placeholders::_1, std::placeholders::_2 ) );
}

void Link::on_receive( error_code ec, std::size_t length ) {
    if( ec ) {
        if( ec == boost::asio::error::eof ) {
            finish( "connection closed by peer" );
        } else if( ec == boost::asio::error::operation_aborted ) {
            finish( "connection closed" );
        } else {
            finish( "error reading from connection: " + ec.message() );
        }
        return;
    }

    parser.append( buffer.data(), length );
    while( true ) {
        auto [ frame, err ] = parser.next();
        if( !err.empty() ) {
            finish( err );
            return;
        }
        if( !frame.has_value() ) {
            break;
        }
        if( on_frame ) {
            on_frame( shared_from_this(), std::move( *frame ) );
        }
        if( !isOpen() ) {
            finish( "connection closed" );
            return;
        }
    }
    do_read();
}

void Link::do_write() {
    std::shared_ptr<const std::vector<uint8_t>> pkt;
    {
        std::lock_guard lg { write_mutex };
        if( closed || tx_queue.empty() ) {
            return;
        }
        pkt = tx_queue.front();
    }
    boost::asio::async_write( sock, boost::asio::buffer( *pkt ), std::bind( &Link::on_send, shared_from_this(), pkt, std::placeholders::_1, std::placeholders::_2 ) );
}

void Link::on_send( std::shared_ptr<const std::vector<uint8_t>> pkt, error_code ec, std::size_t length ) {
    if( ec ) {
        if( ec != boost::asio::error::operation_aborted ) {
            logger.logError() << LOGS::LINK << "Error sending " << pkt->size() << " bytes to " << remote_addr << ": " << ec.message() << std::endl;
        }
        shutdown();
        return;
    }
    logger.logTrace() << LOGS::LINK << "Sent " << length << " bytes to " << remote_addr << std::endl;

    bool more = false;
    {
        std::lock_guard lg { write_mutex };
        if( !tx_queue.empty() ) {
            tx_queue.pop_front();
        }
        more = !closed && !tx_queue.empty();
    }
    if( more ) {
        do_write();
    }
}

void Link::shutdown() {
    {
        std::lock_guard lg { write_mutex };
        closed = true;
        tx_queue.clear();
    }
    if( !sock.is_open() ) {
        return;
    }
    error_code ec;
    sock.shutdown( socket_tcp::shutdown_both, ec );
    sock.close( ec );
}

void Link::finish( const std::string &reason ) {
    if( finished ) {
        return;
    }
    finished = true;
    shutdown();

    auto handler = std::move( on_close );
    on_frame = nullptr;
    on_close = nullptr;
    if( handler ) {
        handler( shared_from_this(), reason );
    }
}
