#include <iostream>
#include <fstream>
#include <string>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>
#include "yaml.hpp"

#include "config.hpp"
#include "log.hpp"
#include "net_integer.hpp"
#include "packet.hpp"
#include "capture.hpp"
#include "proxy.hpp"
#include "evloop.hpp"
#include "string_helpers.hpp"

static void conf_init( const std::string &path ) {
    TunnelConf conf;
    conf.interface = "eth0";
    conf.mode = TUNNEL_MODE::SERVER;
    conf.address = "0.0.0.0:8863";
    conf.allowed_ip = "192.0.2.10";

    YAML::Node config;
    config = conf;

    std::ofstream fout( path );
    fout << config << std::endl;
}

int main( int argc, char *argv[] ) {
    std::string path_config { "config.yaml" };
    std::string interface;
    std::string mode;
    std::string address;
    std::string allowed_ip;

    boost::program_options::options_description desc {
        "PPPoE tunnel daemon.\n"
        "Carries PPPoE Discovery and Session frames between two hosts over TCP. The server side runs on the interface facing the ISP, the client side on the interface facing the PPP client. Configuration is read from the config file, the options below override it.\n"
        "\n"
        "Arguments"
    };
    desc.add_options()
    ( "path,p", boost::program_options::value( &path_config ), "Path to config: default is \"config.yaml\"" )
    ( "genconf,g", "Generate a sample configuration" )
    ( "interface,i", boost::program_options::value( &interface ), "Interface to bind to" )
    ( "mode,m", boost::program_options::value( &mode ), "Mode: client or server" )
    ( "address,a", boost::program_options::value( &address ), "Address to listen on (server) or connect to (client), host:port" )
    ( "allowed-ip", boost::program_options::value( &allowed_ip ), "The only client IP accepted in server mode" )
    ( "help,h", "Print this message" )
    ;

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store( boost::program_options::parse_command_line( argc, argv, desc ), vm );
        boost::program_options::notify( vm );
    } catch( std::exception &e ) {
        std::cerr << "Error on parsing arguments: " << e.what() << std::endl;
        return 1;
    }

    if( vm.count( "help" ) ) {
        std::cout << desc << "\n";
        return 0;
    }

    if( vm.count( "genconf" ) ) {
        conf_init( path_config );
        return 0;
    }

    Logger logger;
    TunnelConf conf;
    try {
        // Without a config file everything must come from the command line
        if( std::ifstream probe { path_config }; probe.good() ) {
            YAML::Node config = YAML::LoadFile( path_config );
            conf = config.as<TunnelConf>();
        } else if( vm.count( "path" ) ) {
            logger.logError() << LOGS::MAIN << "Cannot open config file " << path_config << std::endl;
            return 1;
        }
        if( !mode.empty() ) {
            conf.mode = YAML::Node( mode ).as<TUNNEL_MODE>();
        }
    } catch( std::exception &e ) {
        logger.logError() << LOGS::MAIN << "Cannot load config: " << e.what() << std::endl;
        return 1;
    }

    if( !interface.empty() ) {
        conf.interface = interface;
    }
    if( !address.empty() ) {
        conf.address = address;
    }
    if( !allowed_ip.empty() ) {
        conf.allowed_ip = allowed_ip;
    }

    if( auto const &error = conf.validate(); !error.empty() ) {
        logger.logError() << LOGS::MAIN << error << std::endl;
        return 1;
    }
    logger.setLevel( conf.log_level );

    auto order = detectByteOrder();
    io_service io;

    try {
        CaptureEndpoint discovery { io, logger, conf.interface, ETH_PPPOE_DISCOVERY, conf.isServer(), order };
        CaptureEndpoint session { io, logger, conf.interface, ETH_PPPOE_SESSION, conf.isServer(), order };

        TunnelProxy proxy { io, logger, conf, discovery, session, order };
        EVLoop loop { io, logger, proxy, discovery, session };

        discovery.setErrorHandler( std::bind( &EVLoop::on_endpoint_error, &loop, std::placeholders::_1 ) );
        session.setErrorHandler( std::bind( &EVLoop::on_endpoint_error, &loop, std::placeholders::_1 ) );

        proxy.start();
        logger.logInfo() << LOGS::MAIN << "PPPoE tunnel started in " << conf.mode << " mode on interface " << conf.interface << std::endl;

        io.run();

        discovery.setErrorHandler( nullptr );
        session.setErrorHandler( nullptr );
        return loop.exitCode();
    } catch( CaptureError &e ) {
        logger.logError() << LOGS::MAIN << "Failed to initialize capture: " << e.what() << std::endl;
        switch( e.kind ) {
        case CAPTURE_ERROR::INTERFACE_NOT_FOUND:
            logger.logError() << LOGS::MAIN << "Check the interface name given with --interface or in " << path_config << std::endl;
            break;
        case CAPTURE_ERROR::SOCKET_ERROR:
        case CAPTURE_ERROR::BIND_ERROR:
            logger.logError() << LOGS::MAIN << "Raw sockets need root or CAP_NET_RAW" << std::endl;
            break;
        }
    } catch( std::exception &e ) {
        logger.logError() << LOGS::MAIN << "Error on run event loop: " << e.what() << std::endl;
    }
    return 1;
}
