#include "config.hpp"
#include "utils.hpp"

std::string TunnelConf::validate() const {
    if( interface.empty() ) {
        return "Interface name must be specified";
    }
    if( address.empty() ) {
        return "Address must be specified";
    }
    if( auto const &[ host, port, err ] = splitHostPort( address ); !err.empty() ) {
        return "Incorrect address \"" + address + "\": " + err;
    } else if( mode == TUNNEL_MODE::CLIENT && host.empty() ) {
        return "Address \"" + address + "\" has no host to connect to";
    }
    if( mode == TUNNEL_MODE::SERVER && allowed_ip.empty() ) {
        return "Allowed client IP must be specified in server mode";
    }
    if( keepalive_interval.count() <= 0 ) {
        return "Keepalive interval must be positive";
    }
    if( reconnect_interval.count() <= 0 ) {
        return "Reconnect interval must be positive";
    }
    return {};
}
