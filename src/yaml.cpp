#include <boost/algorithm/string.hpp>

#include "yaml.hpp"
#include "config.hpp"

YAML::Node YAML::convert<TUNNEL_MODE>::encode( const TUNNEL_MODE &rhs ) {
    Node node;
    switch( rhs ) {
    case TUNNEL_MODE::CLIENT:
        node = "client"; break;
    case TUNNEL_MODE::SERVER:
        node = "server"; break;
    }
    return node;
}

bool YAML::convert<TUNNEL_MODE>::decode( const YAML::Node &node, TUNNEL_MODE &rhs ) {
    auto t = boost::algorithm::to_lower_copy( node.as<std::string>() );
    if( t == "client" ) {
        rhs = TUNNEL_MODE::CLIENT;
    } else if( t == "server" ) {
        rhs = TUNNEL_MODE::SERVER;
    } else {
        return false;
    }
    return true;
}

YAML::Node YAML::convert<LOGL>::encode( const LOGL &rhs ) {
    Node node;
    switch( rhs ) {
    case LOGL::TRACE:
        node = "TRACE"; break;
    case LOGL::DEBUG:
        node = "DEBUG"; break;
    case LOGL::INFO:
        node = "INFO"; break;
    case LOGL::WARN:
        node = "WARN"; break;
    case LOGL::ERROR:
        node = "ERROR"; break;
    case LOGL::ALERT:
        node = "ALERT"; break;
    }
    return node;
}

bool YAML::convert<LOGL>::decode( const YAML::Node &node, LOGL &rhs ) {
    auto t = boost::algorithm::to_upper_copy( node.as<std::string>() );
    if( t == "TRACE" ) {
        rhs = LOGL::TRACE;
    } else if( t == "DEBUG" ) {
        rhs = LOGL::DEBUG;
    } else if( t == "INFO" ) {
        rhs = LOGL::INFO;
    } else if( t == "WARN" ) {
        rhs = LOGL::WARN;
    } else if( t == "ERROR" ) {
        rhs = LOGL::ERROR;
    } else if( t == "ALERT" ) {
        rhs = LOGL::ALERT;
    } else {
        return false;
    }
    return true;
}

YAML::Node YAML::convert<TunnelConf>::encode( const TunnelConf &rhs ) {
    Node node;
    node[ "interface" ] = rhs.interface;
    node[ "mode" ] = rhs.mode;
    node[ "address" ] = rhs.address;
    if( !rhs.allowed_ip.empty() ) {
        node[ "allowed_ip" ] = rhs.allowed_ip;
    }
    node[ "keepalive_interval" ] = std::chrono::duration_cast<std::chrono::seconds>( rhs.keepalive_interval ).count();
    node[ "reconnect_interval" ] = std::chrono::duration_cast<std::chrono::seconds>( rhs.reconnect_interval ).count();
    node[ "keepalive_miss_limit" ] = rhs.keepalive_miss_limit;
    node[ "log_level" ] = rhs.log_level;
    return node;
}

bool YAML::convert<TunnelConf>::decode( const YAML::Node &node, TunnelConf &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    rhs.interface = node[ "interface" ].as<std::string>();
    rhs.mode = node[ "mode" ].as<TUNNEL_MODE>();
    rhs.address = node[ "address" ].as<std::string>();
    if( node[ "allowed_ip" ].IsDefined() ) {
        rhs.allowed_ip = node[ "allowed_ip" ].as<std::string>();
    }
    if( node[ "keepalive_interval" ].IsDefined() ) {
        rhs.keepalive_interval = std::chrono::seconds( node[ "keepalive_interval" ].as<uint32_t>() );
    }
    if( node[ "reconnect_interval" ].IsDefined() ) {
        rhs.reconnect_interval = std::chrono::seconds( node[ "reconnect_interval" ].as<uint32_t>() );
    }
    if( node[ "keepalive_miss_limit" ].IsDefined() ) {
        rhs.keepalive_miss_limit = node[ "keepalive_miss_limit" ].as<uint32_t>();
    }
    if( node[ "log_level" ].IsDefined() ) {
        rhs.log_level = node[ "log_level" ].as<LOGL>();
    }
    return true;
}
