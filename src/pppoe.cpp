#include <sstream>
#include <iomanip>

#include "pppoe.hpp"
#include "ethernet.hpp"
#include "net_integer.hpp"

static constexpr std::size_t TAGS_OFFSET { sizeof( ETHERNET_HDR ) + sizeof( PPPOEDISC_HDR ) };
static constexpr std::size_t PPP_PROTO_OFFSET { sizeof( ETHERNET_HDR ) + sizeof( PPPOEDISC_HDR ) };
static constexpr std::size_t LCP_CODE_OFFSET { sizeof( ETHERNET_HDR ) + sizeof( PPPOESESSION_HDR ) };

std::string pppoe::checkFrame( const std::vector<uint8_t> &pkt ) {
    if( pkt.size() < PPPOE_MIN_FRAME ) {
        return "Frame is too short: " + std::to_string( pkt.size() ) + " bytes";
    }
    if( pkt[ ETH_HDR_LEN ] != PPPOE_VER_TYPE ) {
        return "Not a PPPoE v1 type 1 frame";
    }
    return {};
}

PPPOE_CODE pppoe::getCode( const std::vector<uint8_t> &pkt ) {
    return static_cast<PPPOE_CODE>( pkt[ ETH_HDR_LEN + 1 ] );
}

uint16_t pppoe::getSessionId( const std::vector<uint8_t> &pkt ) {
    return readBE16( pkt.data() + ETH_HDR_LEN + 2 );
}

bool pppoe::acceptFrame( std::vector<uint8_t> &pkt, uint16_t ethertype, bool is_server ) {
    if( !checkFrame( pkt ).empty() ) {
        return false;
    }
    if( ethertype == ETH_PPPOE_DISCOVERY && is_server && getCode( pkt ) == PPPOE_CODE::PADI ) {
        rewriteHostUniq( pkt );
    }
    return true;
}

std::tuple<std::map<PPPOE_TAG,std::string>,std::string> pppoe::parseTags( const std::vector<uint8_t> &pkt ) {
    std::map<PPPOE_TAG,std::string> tags;
    std::size_t offset = TAGS_OFFSET;

    while( offset + sizeof( PPPOEDISC_TLV ) <= pkt.size() ) {
        auto tag = PPPOE_TAG { readBE16( pkt.data() + offset ) };
        auto len = readBE16( pkt.data() + offset + 2 );

        if( tag == PPPOE_TAG::END_OF_LIST ) {
            break;
        }

        auto value_start = offset + sizeof( PPPOEDISC_TLV );
        if( value_start + len > pkt.size() ) {
            return { std::move( tags ), "Tag " + std::to_string( static_cast<uint16_t>( tag ) ) + " runs past the end of frame" };
        }

        std::string val { pkt.begin() + value_start, pkt.begin() + value_start + len };
        if( auto const &[ it, ret ] = tags.emplace( tag, std::move( val ) ); !ret ) {
            return { std::move( tags ), "Cannot insert tag " + std::to_string( static_cast<uint16_t>( tag ) ) + " in tag map" };
        }
        offset = value_start + len;
    }
    return { std::move( tags ), "" };
}

void pppoe::rewriteHostUniq( std::vector<uint8_t> &pkt ) {
    std::size_t offset = TAGS_OFFSET;

    while( offset + sizeof( PPPOEDISC_TLV ) <= pkt.size() ) {
        auto tag = PPPOE_TAG { readBE16( pkt.data() + offset ) };
        std::size_t len = readBE16( pkt.data() + offset + 2 );
        auto value_start = offset + sizeof( PPPOEDISC_TLV );

        if( tag == PPPOE_TAG::HOST_UNIQ && value_start + len <= pkt.size() ) {
            for( std::size_t i = value_start; i < value_start + len; i++ ) {
                pkt[ i ] ^= HOST_UNIQ_XOR;
            }
            return;
        }

        offset = value_start + len;
        if( tag == PPPOE_TAG::END_OF_LIST ) {
            break;
        }
    }
}

std::string pppoe::sessionEvent( const std::vector<uint8_t> &pkt, bool lcp_only ) {
    if( pkt.size() < PPP_PROTO_OFFSET + 2 ) {
        return {};
    }

    std::ostringstream out;
    auto sid = getSessionId( pkt );
    auto proto = PPP_PROTO { readBE16( pkt.data() + PPP_PROTO_OFFSET ) };

    switch( proto ) {
    case PPP_PROTO::LCP:
        if( pkt.size() <= LCP_CODE_OFFSET ) {
            return {};
        }
        switch( static_cast<LCP_CODE>( pkt[ LCP_CODE_OFFSET ] ) ) {
        case LCP_CODE::CONF_REQ:
            out << "session establishment request";
            break;
        case LCP_CODE::TERM_REQ:
            out << "session termination request";
            break;
        default:
            return {};
        }
        break;
    case PPP_PROTO::IPV4:
        return {};
    default:
        if( lcp_only || static_cast<uint16_t>( proto ) == 0 ) {
            return {};
        }
        out << "session packet, protocol: 0x" << std::hex << std::setw( 4 ) << std::setfill( '0' ) << static_cast<uint16_t>( proto );
        out << std::dec;
        break;
    }
    out << ", ID: 0x" << std::hex << std::setw( 4 ) << std::setfill( '0' ) << sid;
    return out.str();
}
