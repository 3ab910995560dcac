#include <iterator>
#include <boost/algorithm/hex.hpp>

#include "utils.hpp"

std::tuple<std::string,uint16_t,std::string> splitHostPort( const std::string &address ) {
    auto pos = address.rfind( ':' );
    if( pos == std::string::npos ) {
        return { "", 0, "missing port" };
    }

    std::string host = address.substr( 0, pos );
    std::string port_str = address.substr( pos + 1 );

    if( host.size() >= 2 && host.front() == '[' && host.back() == ']' ) {
        host = host.substr( 1, host.size() - 2 );
    } else if( host.find( ':' ) != std::string::npos ) {
        return { "", 0, "IPv6 address must be enclosed in brackets" };
    }

    if( port_str.empty() || port_str.size() > 5 || port_str.find_first_not_of( "0123456789" ) != std::string::npos ) {
        return { "", 0, "incorrect port \"" + port_str + "\"" };
    }
    auto port = std::stoul( port_str );
    if( port > UINT16_MAX ) {
        return { "", 0, "port is out of range" };
    }
    return { std::move( host ), static_cast<uint16_t>( port ), "" };
}

std::string endpointIP( const boost::asio::ip::tcp::endpoint &endpoint ) {
    auto const &addr = endpoint.address();
    if( addr.is_v6() && addr.to_v6().is_v4_mapped() ) {
        return boost::asio::ip::make_address_v4( boost::asio::ip::v4_mapped, addr.to_v6() ).to_string();
    }
    return addr.to_string();
}

bool isClientAllowed( const std::string &allowed_ip, const boost::asio::ip::tcp::endpoint &remote ) {
    return endpointIP( remote ) == allowed_ip;
}

std::string hexString( const std::vector<uint8_t> &pkt ) {
    std::string result;
    result.reserve( pkt.size() * 2 );
    boost::algorithm::hex_lower( pkt.begin(), pkt.end(), std::back_inserter( result ) );
    return result;
}
