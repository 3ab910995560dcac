#include <iostream>
#include <iomanip>
#include <cstdio>
#include <cstring>

#include "string_helpers.hpp"
#include "packet.hpp"
#include "ethernet.hpp"
#include "net_integer.hpp"
#include "tunnel.hpp"
#include "config.hpp"

std::ostream& operator<<( std::ostream &stream, const mac_t &mac ) {
    char buf[ 18 ];
    snprintf( buf, sizeof( buf ), "%02hhx:%02hhx:%02hhx:%02hhx:%02hhx:%02hhx", mac[0], mac[1], mac[2], mac[3], mac[4], mac[5] );
    return stream << buf;
}

std::ostream& operator<<( std::ostream &stream, const PPPOE_CODE &code ) {
    switch( code ) {
    case PPPOE_CODE::SESSION_DATA: stream << "SESSION_DATA"; break;
    case PPPOE_CODE::PADI: stream << "PADI"; break;
    case PPPOE_CODE::PADO: stream << "PADO"; break;
    case PPPOE_CODE::PADR: stream << "PADR"; break;
    case PPPOE_CODE::PADS: stream << "PADS"; break;
    case PPPOE_CODE::PADT: stream << "PADT"; break;
    default:
        stream << "code " << static_cast<int>( code );
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const PPPOE_TAG &tag ) {
    switch( tag ) {
    case PPPOE_TAG::END_OF_LIST: stream << "End-Of-List"; break;
    case PPPOE_TAG::SERVICE_NAME: stream << "Service-Name"; break;
    case PPPOE_TAG::AC_NAME: stream << "AC-Name"; break;
    case PPPOE_TAG::HOST_UNIQ: stream << "Host-Uniq"; break;
    case PPPOE_TAG::AC_COOKIE: stream << "AC-Cookie"; break;
    case PPPOE_TAG::VENDOR_SPECIFIC: stream << "Vendor-Specific"; break;
    case PPPOE_TAG::RELAY_SESSION_ID: stream << "Relay-Session-Id"; break;
    case PPPOE_TAG::SERVICE_NAME_ERROR: stream << "Service-Name-Error"; break;
    case PPPOE_TAG::AC_SYSTEM_ERROR: stream << "AC-System-Error"; break;
    case PPPOE_TAG::GENERIC_ERROR: stream << "Generic-Error"; break;
    default:
        stream << "tag " << static_cast<uint16_t>( tag );
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const PPP_PROTO &proto ) {
    switch( proto ) {
    case PPP_PROTO::CHAP: stream << "CHAP"; break;
    case PPP_PROTO::IPCP: stream << "IPCP"; break;
    case PPP_PROTO::LCP: stream << "LCP"; break;
    case PPP_PROTO::IPV4: stream << "IPV4"; break;
    case PPP_PROTO::IPV6: stream << "IPV6"; break;
    case PPP_PROTO::IPV6CP: stream << "IPV6CP"; break;
    case PPP_PROTO::PAP: stream << "PAP"; break;
    case PPP_PROTO::LQR: stream << "LQR"; break;
    default:
        stream << "proto " << static_cast<uint16_t>( proto );
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const TUNNEL_FRAME &type ) {
    switch( type ) {
    case TUNNEL_FRAME::PING: stream << "PING"; break;
    case TUNNEL_FRAME::PONG: stream << "PONG"; break;
    case TUNNEL_FRAME::DISCOVERY: stream << "DISCOVERY"; break;
    case TUNNEL_FRAME::SESSION: stream << "SESSION"; break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const TUNNEL_MODE &mode ) {
    switch( mode ) {
    case TUNNEL_MODE::CLIENT: stream << "client"; break;
    case TUNNEL_MODE::SERVER: stream << "server"; break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const PacketPrint &pkt ) {
    if( pkt.bytes.size() < sizeof( ETHERNET_HDR ) ) {
        return stream << "truncated frame of " << pkt.bytes.size() << " bytes";
    }

    ETHERNET_HDR eth;
    std::memcpy( &eth, pkt.bytes.data(), sizeof( eth ) );
    auto eth_type = readBE16( pkt.bytes.data() + 12 );

    auto flags = stream.flags();
    stream << eth.src_mac << " -> " << eth.dst_mac;
    stream << " ethertype: " << std::hex << std::showbase << eth_type;
    stream.flags( flags );

    if( pkt.bytes.size() < PPPOE_MIN_FRAME ) {
        return stream;
    }

    auto pppoe = pkt.bytes.data() + sizeof( ETHERNET_HDR );
    stream << " ver/type: " << std::hex << std::showbase << static_cast<int>( pppoe[ 0 ] );
    stream.flags( flags );
    stream << " code: " << static_cast<PPPOE_CODE>( pppoe[ 1 ] );
    stream << " session id: " << readBE16( pppoe + 2 );
    stream << " length: " << readBE16( pppoe + 4 );
    if( eth_type == ETH_PPPOE_SESSION && pkt.bytes.size() >= PPPOE_MIN_FRAME + 2 ) {
        stream << " protocol: " << static_cast<PPP_PROTO>( readBE16( pppoe + 6 ) );
    }

    return stream;
}
