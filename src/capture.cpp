#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <net/if.h>
#include <linux/if_ether.h>

#include "capture.hpp"
#include "packet.hpp"
#include "pppoe.hpp"
#include "string_helpers.hpp"
#include "utils.hpp"

CaptureEndpoint::CaptureEndpoint( io_service &io, Logger &l, const std::string &i, uint16_t et, bool s, ByteOrder order ):
    logger( l ),
    ifname( i ),
    ep_name( et == ETH_PPPOE_DISCOVERY ? "discovery" : "session" ),
    ethertype( et ),
    is_server( s ),
    subsystem( et == ETH_PPPOE_DISCOVERY ? LOGS::PPPOED : LOGS::PPPOES ),
    raw_sock( io )
{
    auto ifindex = if_nametoindex( ifname.c_str() );
    if( ifindex == 0 ) {
        throw CaptureError { CAPTURE_ERROR::INTERFACE_NOT_FOUND, "Interface not found: " + ifname + ": " + std::strerror( errno ) };
    }

    memset( &link_addr, 0, sizeof( link_addr ) );
    link_addr.sll_family = AF_PACKET;
    link_addr.sll_protocol = hton16( ethertype, order );
    link_addr.sll_ifindex = ifindex;

    boost::system::error_code ec;
    raw_sock.open( boost::asio::generic::raw_protocol( AF_PACKET, hton16( ethertype, order ) ), ec );
    if( ec ) {
        throw CaptureError { CAPTURE_ERROR::SOCKET_ERROR, "Failed to create " + ep_name + " socket: " + ec.message() };
    }

    raw_sock.bind( boost::asio::generic::raw_protocol::endpoint( &link_addr, sizeof( link_addr ) ), ec );
    if( ec ) {
        boost::system::error_code ignored;
        raw_sock.close( ignored );
        throw CaptureError { CAPTURE_ERROR::BIND_ERROR, "Failed to bind " + ep_name + " socket to " + ifname + ": " + ec.message() };
    }

    logger.logInfo() << subsystem << "Listening for PPPoE " << ep_name << " on interface " << ifname << std::endl;
    start_receive();
}

CaptureEndpoint::~CaptureEndpoint() {
    close();
}

void CaptureEndpoint::setForward( ForwardHandler handler ) {
    std::lock_guard lg { handler_mutex };
    forward = std::move( handler );
}

void CaptureEndpoint::setErrorHandler( EndpointErrorHandler handler ) {
    std::lock_guard lg { handler_mutex };
    on_error = std::move( handler );
}

void CaptureEndpoint::close() {
    if( closed.exchange( true ) ) {
        return;
    }
    boost::system::error_code ec;
    raw_sock.close( ec );
    if( ec ) {
        logger.logError() << subsystem << "Error on closing " << ep_name << " socket: " << ec.message() << std::endl;
    }
}

void CaptureEndpoint::start_receive() {
    raw_sock.async_wait( boost::asio::socket_base::wait_type::wait_read, std::bind( &CaptureEndpoint::receive, this, std::placeholders::_1 ) );
}

void CaptureEndpoint::receive( boost::system::error_code ec ) {
    if( closed ) {
        return;
    }
    if( ec ) {
        die( ec.message() );
        return;
    }

    while( true ) {
        auto received = recv( raw_sock.native_handle(), pktbuf.data(), pktbuf.size(), MSG_DONTWAIT );
        if( received < 0 ) {
            if( errno == EINTR ) {
                continue;
            }
            if( errno == EAGAIN || errno == EWOULDBLOCK ) {
                break;
            }
            die( std::strerror( errno ) );
            return;
        }
        process( std::vector<uint8_t>{ pktbuf.begin(), pktbuf.begin() + received } );
        if( closed ) {
            return;
        }
    }
    start_receive();
}

void CaptureEndpoint::die( const std::string &reason ) {
    logger.logError() << subsystem << "Error receiving packet: " << reason << std::endl;

    EndpointErrorHandler handler;
    {
        std::lock_guard lg { handler_mutex };
        handler = on_error;
    }
    if( handler ) {
        handler( "PPPoE " + ep_name + " endpoint on " + ifname + " stopped: " + reason );
    }
}

void CaptureEndpoint::process( std::vector<uint8_t> pkt ) {
    if( !pppoe::acceptFrame( pkt, ethertype, is_server ) ) {
        return;
    }

    logger.logDebug() << LOGS::PACKET << PacketPrint { pkt } << std::endl;
    if( ethertype == ETH_PPPOE_DISCOVERY ) {
        logger.logInfo() << subsystem << "Forwarding " << pkt.size() << " byte PPPoE discovery packet" << std::endl;
        if( logger.getLevel() == LOGL::TRACE ) {
            trace_tags( pkt );
        }
    } else if( auto const &event = pppoe::sessionEvent( pkt ); !event.empty() ) {
        logger.logInfo() << subsystem << "PPPoE " << event << std::endl;
    }

    ForwardHandler handler;
    {
        std::lock_guard lg { handler_mutex };
        handler = forward;
    }
    if( handler ) {
        handler( std::move( pkt ) );
    }
}

void CaptureEndpoint::trace_tags( const std::vector<uint8_t> &pkt ) {
    auto const &[ tags, err ] = pppoe::parseTags( pkt );
    for( auto const &[ tag, value ]: tags ) {
        logger.logTrace() << subsystem << tag << ": " << hexString( { value.begin(), value.end() } ) << std::endl;
    }
    if( !err.empty() ) {
        logger.logTrace() << subsystem << err << std::endl;
    }
}

void CaptureEndpoint::injectPacket( const std::vector<uint8_t> &pkt ) {
    if( pkt.size() < ETH_HDR_LEN ) {
        logger.logError() << subsystem << "Packet too short to inject: " << pkt.size() << " bytes" << std::endl;
        return;
    }

    if( ethertype == ETH_PPPOE_SESSION && pkt.size() >= PPPOE_MIN_FRAME ) {
        if( auto const &event = pppoe::sessionEvent( pkt, true ); !event.empty() ) {
            logger.logInfo() << subsystem << "Injecting PPPoE " << event << std::endl;
        }
    }

    boost::system::error_code ec;
    raw_sock.send_to( boost::asio::buffer( pkt ), boost::asio::generic::raw_protocol::endpoint( &link_addr, sizeof( link_addr ) ), 0, ec );
    if( ec ) {
        logger.logError() << subsystem << "Error injecting " << ep_name << " packet: " << ec.message() << std::endl;
        return;
    }
    if( ethertype == ETH_PPPOE_DISCOVERY ) {
        logger.logInfo() << subsystem << "Injected " << pkt.size() << " byte PPPoE discovery packet" << std::endl;
    }
}
