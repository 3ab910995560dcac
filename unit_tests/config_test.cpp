#include <catch2/catch.hpp>

#include <algorithm>
#include <sstream>

#include "config.hpp"
#include "utils.hpp"
#include "yaml.hpp"
#include "log.hpp"

using boost::asio::ip::tcp;
using boost::asio::ip::make_address;

TEST_CASE( "configuration from yaml", "[config]" ) {
    SECTION( "defaults for optional keys" ) {
        auto node = YAML::Load(
            "interface: eth1\n"
            "mode: Client\n"
            "address: 192.0.2.1:8888\n"
        );
        auto conf = node.as<TunnelConf>();
        CHECK( conf.interface == "eth1" );
        CHECK( conf.mode == TUNNEL_MODE::CLIENT );
        CHECK( conf.address == "192.0.2.1:8888" );
        CHECK( conf.allowed_ip.empty() );
        CHECK( conf.keepalive_interval == std::chrono::seconds( 60 ) );
        CHECK( conf.reconnect_interval == std::chrono::seconds( 5 ) );
        CHECK( conf.keepalive_miss_limit == 0 );
        CHECK( conf.log_level == LOGL::INFO );
        CHECK( conf.validate().empty() );
    }

    SECTION( "all keys" ) {
        auto node = YAML::Load(
            "interface: eth0\n"
            "mode: server\n"
            "address: :8888\n"
            "allowed_ip: 203.0.113.5\n"
            "keepalive_interval: 30\n"
            "reconnect_interval: 2\n"
            "keepalive_miss_limit: 3\n"
            "log_level: debug\n"
        );
        auto conf = node.as<TunnelConf>();
        CHECK( conf.isServer() );
        CHECK( conf.allowed_ip == "203.0.113.5" );
        CHECK( conf.keepalive_interval == std::chrono::seconds( 30 ) );
        CHECK( conf.reconnect_interval == std::chrono::seconds( 2 ) );
        CHECK( conf.keepalive_miss_limit == 3 );
        CHECK( conf.log_level == LOGL::DEBUG );
        CHECK( conf.validate().empty() );
    }

    SECTION( "unknown mode" ) {
        auto node = YAML::Load(
            "interface: eth0\n"
            "mode: relay\n"
            "address: :8888\n"
        );
        CHECK_THROWS( node.as<TunnelConf>() );
    }

    SECTION( "missing interface" ) {
        auto node = YAML::Load(
            "mode: client\n"
            "address: 192.0.2.1:8888\n"
        );
        CHECK_THROWS( node.as<TunnelConf>() );
    }
}

TEST_CASE( "configuration survives a yaml round trip", "[config]" ) {
    TunnelConf conf;
    conf.interface = "eth2";
    conf.mode = TUNNEL_MODE::SERVER;
    conf.address = "0.0.0.0:9000";
    conf.allowed_ip = "198.51.100.7";
    conf.keepalive_miss_limit = 4;
    conf.log_level = LOGL::WARN;

    YAML::Emitter out;
    out << YAML::Node( conf );
    auto back = YAML::Load( out.c_str() ).as<TunnelConf>();

    CHECK( back.interface == conf.interface );
    CHECK( back.mode == conf.mode );
    CHECK( back.address == conf.address );
    CHECK( back.allowed_ip == conf.allowed_ip );
    CHECK( back.keepalive_interval == conf.keepalive_interval );
    CHECK( back.keepalive_miss_limit == 4 );
    CHECK( back.log_level == LOGL::WARN );
}

TEST_CASE( "configuration validation", "[config]" ) {
    TunnelConf conf;
    conf.interface = "eth0";
    conf.mode = TUNNEL_MODE::CLIENT;
    conf.address = "tunnel.example.net:8888";
    CHECK( conf.validate().empty() );

    SECTION( "client needs a host" ) {
        conf.address = ":8888";
        CHECK_FALSE( conf.validate().empty() );
    }

    SECTION( "server needs an allowed client" ) {
        conf.mode = TUNNEL_MODE::SERVER;
        conf.address = ":8888";
        CHECK_FALSE( conf.validate().empty() );
        conf.allowed_ip = "203.0.113.5";
        CHECK( conf.validate().empty() );
    }

    SECTION( "address without port" ) {
        conf.address = "192.0.2.1";
        CHECK_FALSE( conf.validate().empty() );
    }

    SECTION( "interface is mandatory" ) {
        conf.interface.clear();
        CHECK_FALSE( conf.validate().empty() );
    }

    SECTION( "intervals are positive" ) {
        conf.keepalive_interval = std::chrono::milliseconds( 0 );
        CHECK_FALSE( conf.validate().empty() );
    }
}

TEST_CASE( "host and port splitting", "[utils]" ) {
    {
        auto [ host, port, err ] = splitHostPort( "192.0.2.1:8888" );
        CHECK( err.empty() );
        CHECK( host == "192.0.2.1" );
        CHECK( port == 8888 );
    }
    {
        auto [ host, port, err ] = splitHostPort( ":8888" );
        CHECK( err.empty() );
        CHECK( host.empty() );
        CHECK( port == 8888 );
    }
    {
        auto [ host, port, err ] = splitHostPort( "[2001:db8::1]:443" );
        CHECK( err.empty() );
        CHECK( host == "2001:db8::1" );
        CHECK( port == 443 );
    }
    CHECK_FALSE( std::get<2>( splitHostPort( "2001:db8::1:443" ) ).empty() );
    CHECK_FALSE( std::get<2>( splitHostPort( "host:port" ) ).empty() );
    CHECK_FALSE( std::get<2>( splitHostPort( "host:70000" ) ).empty() );
    CHECK_FALSE( std::get<2>( splitHostPort( "host" ) ).empty() );
}

TEST_CASE( "client admission by address", "[utils]" ) {
    tcp::endpoint allowed { make_address( "203.0.113.5" ), 40000 };
    tcp::endpoint other { make_address( "203.0.113.6" ), 40000 };
    tcp::endpoint mapped { make_address( "::ffff:203.0.113.5" ), 40001 };

    CHECK( isClientAllowed( "203.0.113.5", allowed ) );
    CHECK_FALSE( isClientAllowed( "203.0.113.5", other ) );
    CHECK( isClientAllowed( "203.0.113.5", mapped ) );
    CHECK_FALSE( isClientAllowed( "203.0.113.50", allowed ) );
    CHECK( endpointIP( mapped ) == "203.0.113.5" );
}

TEST_CASE( "log records respect the level", "[log]" ) {
    std::ostringstream sink;
    Logger logger { sink };
    logger.setLevel( LOGL::WARN );

    logger.logInfo() << LOGS::MAIN << "hidden" << std::endl;
    logger.logError() << LOGS::TUNNEL << "visible" << std::endl;

    auto text = sink.str();
    CHECK( text.find( "hidden" ) == std::string::npos );
    CHECK( text.find( "visible" ) != std::string::npos );
    CHECK( std::count( text.begin(), text.end(), '\n' ) == 1 );
}
