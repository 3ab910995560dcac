#include <catch2/catch.hpp>

#include <sstream>

#include "capture.hpp"
#include "pppoe.hpp"
#include "test_helpers.hpp"

static const uint16_t HOST_UNIQ = static_cast<uint16_t>( PPPOE_TAG::HOST_UNIQ );
static const uint16_t SERVICE_NAME = static_cast<uint16_t>( PPPOE_TAG::SERVICE_NAME );
static const uint16_t END_OF_LIST = static_cast<uint16_t>( PPPOE_TAG::END_OF_LIST );

TEST_CASE( "short and malformed frames are dropped", "[pppoe]" ) {
    std::vector<uint8_t> pkt( 19, 0 );
    CHECK_FALSE( pppoe::checkFrame( pkt ).empty() );
    CHECK_FALSE( pppoe::acceptFrame( pkt, ETH_PPPOE_DISCOVERY, true ) );

    auto padi = makeDiscovery( PPPOE_CODE::PADI, {} );
    REQUIRE( padi.size() == PPPOE_MIN_FRAME );
    CHECK( pppoe::checkFrame( padi ).empty() );

    padi[ ETH_HDR_LEN ] = 0x21;
    CHECK_FALSE( pppoe::checkFrame( padi ).empty() );
    CHECK_FALSE( pppoe::acceptFrame( padi, ETH_PPPOE_DISCOVERY, false ) );
}

TEST_CASE( "server obfuscates Host-Uniq of PADI", "[pppoe]" ) {
    auto pkt = makeDiscovery( PPPOE_CODE::PADI, {
        { SERVICE_NAME, {} },
        { HOST_UNIQ, { 0x01, 0x02, 0x03, 0x04 } }
    });
    auto orig = pkt;

    REQUIRE( pppoe::acceptFrame( pkt, ETH_PPPOE_DISCOVERY, true ) );
    REQUIRE( pkt.size() == orig.size() );

    // service-name TLV (4 bytes) then the Host-Uniq TLV header
    std::size_t value_start = PPPOE_MIN_FRAME + 4 + 4;
    for( std::size_t i = 0; i < pkt.size(); i++ ) {
        if( i >= value_start && i < value_start + 4 ) {
            CHECK( pkt[ i ] == ( orig[ i ] ^ HOST_UNIQ_XOR ) );
        } else {
            CHECK( pkt[ i ] == orig[ i ] );
        }
    }

    auto [ tags, err ] = pppoe::parseTags( pkt );
    CHECK( err.empty() );
    CHECK( tags[ PPPOE_TAG::HOST_UNIQ ] == std::string { 0x43, 0x40, 0x41, 0x46 } );
}

TEST_CASE( "only the first Host-Uniq is rewritten", "[pppoe]" ) {
    auto pkt = makeDiscovery( PPPOE_CODE::PADI, {
        { HOST_UNIQ, { 0x10 } },
        { HOST_UNIQ, { 0x20 } }
    });
    pppoe::rewriteHostUniq( pkt );
    CHECK( pkt[ PPPOE_MIN_FRAME + 4 ] == ( 0x10 ^ HOST_UNIQ_XOR ) );
    CHECK( pkt[ PPPOE_MIN_FRAME + 9 ] == 0x20 );
}

TEST_CASE( "frames without a usable Host-Uniq are left alone", "[pppoe]" ) {
    SECTION( "no Host-Uniq tag" ) {
        auto pkt = makeDiscovery( PPPOE_CODE::PADI, { { SERVICE_NAME, { 'i', 's', 'p' } } } );
        auto orig = pkt;
        REQUIRE( pppoe::acceptFrame( pkt, ETH_PPPOE_DISCOVERY, true ) );
        CHECK( pkt == orig );
    }

    SECTION( "Host-Uniq runs past the end of frame" ) {
        auto pkt = makeDiscovery( PPPOE_CODE::PADI, { { HOST_UNIQ, { 0x01, 0x02 } } } );
        // claim 16 bytes of value while only 2 are present
        pkt[ PPPOE_MIN_FRAME + 3 ] = 16;
        auto orig = pkt;
        REQUIRE( pppoe::acceptFrame( pkt, ETH_PPPOE_DISCOVERY, true ) );
        CHECK( pkt == orig );

        auto [ tags, err ] = pppoe::parseTags( pkt );
        CHECK_FALSE( err.empty() );
    }

    SECTION( "Host-Uniq after End-Of-List" ) {
        auto pkt = makeDiscovery( PPPOE_CODE::PADI, {
            { END_OF_LIST, {} },
            { HOST_UNIQ, { 0x01, 0x02 } }
        });
        auto orig = pkt;
        REQUIRE( pppoe::acceptFrame( pkt, ETH_PPPOE_DISCOVERY, true ) );
        CHECK( pkt == orig );
    }
}

TEST_CASE( "Host-Uniq is kept for clients and other discovery codes", "[pppoe]" ) {
    auto padi = makeDiscovery( PPPOE_CODE::PADI, { { HOST_UNIQ, { 0xaa, 0xbb } } } );
    auto orig = padi;
    REQUIRE( pppoe::acceptFrame( padi, ETH_PPPOE_DISCOVERY, false ) );
    CHECK( padi == orig );

    auto pado = makeDiscovery( PPPOE_CODE::PADO, { { HOST_UNIQ, { 0xaa, 0xbb } } } );
    orig = pado;
    REQUIRE( pppoe::acceptFrame( pado, ETH_PPPOE_DISCOVERY, true ) );
    CHECK( pado == orig );

    auto padr = makeDiscovery( PPPOE_CODE::PADR, { { HOST_UNIQ, { 0xaa, 0xbb } } } );
    orig = padr;
    REQUIRE( pppoe::acceptFrame( padr, ETH_PPPOE_DISCOVERY, true ) );
    CHECK( padr == orig );

    // same bytes received on the session socket are not discovery
    auto other = makeDiscovery( PPPOE_CODE::PADI, { { HOST_UNIQ, { 0xaa, 0xbb } } } );
    orig = other;
    REQUIRE( pppoe::acceptFrame( other, ETH_PPPOE_SESSION, true ) );
    CHECK( other == orig );
}

TEST_CASE( "session frames are described for the log", "[pppoe]" ) {
    auto conf_req = makeSession( 0x1234, static_cast<uint16_t>( PPP_PROTO::LCP ), { static_cast<uint8_t>( LCP_CODE::CONF_REQ ), 0x01, 0x00, 0x04 } );
    CHECK( pppoe::getSessionId( conf_req ) == 0x1234 );
    CHECK( pppoe::getCode( conf_req ) == PPPOE_CODE::SESSION_DATA );
    CHECK( pppoe::sessionEvent( conf_req ) == "session establishment request, ID: 0x1234" );

    auto term_req = makeSession( 0x0001, static_cast<uint16_t>( PPP_PROTO::LCP ), { static_cast<uint8_t>( LCP_CODE::TERM_REQ ), 0x02, 0x00, 0x04 } );
    CHECK( pppoe::sessionEvent( term_req ) == "session termination request, ID: 0x0001" );

    auto echo = makeSession( 0x0001, static_cast<uint16_t>( PPP_PROTO::LCP ), { static_cast<uint8_t>( LCP_CODE::ECHO_REQ ), 0x02, 0x00, 0x08 } );
    CHECK( pppoe::sessionEvent( echo ).empty() );

    auto ipcp = makeSession( 0x00ff, 0x8021, { 0x01, 0x01, 0x00, 0x04 } );
    CHECK( pppoe::sessionEvent( ipcp ) == "session packet, protocol: 0x8021, ID: 0x00ff" );

    // injected frames only report LCP establishment and termination
    CHECK( pppoe::sessionEvent( ipcp, true ).empty() );
    auto pap = makeSession( 0x00ff, static_cast<uint16_t>( PPP_PROTO::PAP ), { 0x01, 0x01, 0x00, 0x04 } );
    CHECK( pppoe::sessionEvent( pap, true ).empty() );
    CHECK( pppoe::sessionEvent( conf_req, true ) == "session establishment request, ID: 0x1234" );
    CHECK( pppoe::sessionEvent( term_req, true ) == "session termination request, ID: 0x0001" );

    auto ip = makeSession( 0x00ff, static_cast<uint16_t>( PPP_PROTO::IPV4 ), { 0x45, 0x00 } );
    CHECK( pppoe::sessionEvent( ip ).empty() );
}

TEST_CASE( "capture on a missing interface reports its kind", "[capture]" ) {
    std::ostringstream sink;
    Logger logger { sink };
    boost::asio::io_context io;

    try {
        CaptureEndpoint ep { io, logger, "nosuchif0", ETH_PPPOE_DISCOVERY, true, detectByteOrder() };
        FAIL( "endpoint opened on a missing interface" );
    } catch( const CaptureError &e ) {
        CHECK( e.kind == CAPTURE_ERROR::INTERFACE_NOT_FOUND );
        CHECK( std::string { e.what() }.find( "nosuchif0" ) != std::string::npos );
    }
}
