#ifndef PACKET_HPP_
#define PACKET_HPP_

#include <array>
#include <vector>
#include <cstdint>
#include <cstddef>

/* Ethernet frame types according to RFC 2516 */
#define ETH_PPPOE_DISCOVERY 0x8863
#define ETH_PPPOE_SESSION   0x8864

// Ethernet header + the fixed part of the PPPoE header
constexpr std::size_t PPPOE_MIN_FRAME { 20 };
constexpr std::size_t ETH_HDR_LEN { 14 };
constexpr uint8_t PPPOE_VER_TYPE { 0x11 };

// Applied to every Host-Uniq value byte of a PADI forwarded by the server side.
// Compatibility transform only, it gives no secrecy or integrity.
constexpr uint8_t HOST_UNIQ_XOR { 0x42 };

enum class PPPOE_CODE: uint8_t {
    SESSION_DATA = 0x00,
    PADI = 0x09,
    PADO = 0x07,
    PADR = 0x19,
    PADS = 0x65,
    PADT = 0xa7
};

enum class PPP_PROTO : uint16_t {
    IPV4 = 0x0021,
    IPV6 = 0x0057,
    IPV6CP = 0x8057,
    LCP = 0xc021,
    PAP = 0xc023,
    CHAP = 0xc223,
    IPCP = 0x8021,
    LQR = 0xc025,
};

enum class PPPOE_TAG: uint16_t {
    END_OF_LIST = 0x0000,
    SERVICE_NAME = 0x0101,
    AC_NAME = 0x0102,
    HOST_UNIQ = 0x0103,
    AC_COOKIE = 0x0104,
    VENDOR_SPECIFIC = 0x0105,
    RELAY_SESSION_ID = 0x0110,
    SERVICE_NAME_ERROR = 0x0201,
    AC_SYSTEM_ERROR = 0x0202,
    GENERIC_ERROR = 0x0203,
};

enum class LCP_CODE : uint8_t {
    VENDOR_SPECIFIC = 0,
    CONF_REQ = 1,
    CONF_ACK = 2,
    CONF_NAK = 3,
    CONF_REJ = 4,
    TERM_REQ = 5,
    TERM_ACK = 6,
    CODE_REJ = 7,
    PROTO_REJ = 8,
    ECHO_REQ = 9,
    ECHO_REPLY = 10,
    DISCARD_REQ = 11,
    IDENTIFICATION = 12,
    TIME_REMAINING = 13,
};

struct PPPOEDISC_TLV {
    uint16_t type;
    uint16_t length;
    uint8_t value[0];
}__attribute__((__packed__));
static_assert( sizeof( PPPOEDISC_TLV ) == 4 );

struct PPPOEDISC_HDR {
    uint8_t type : 4;
    uint8_t version : 4;
    PPPOE_CODE code;
    uint16_t session_id;
    uint16_t length;
    uint8_t data[0];
}__attribute__((__packed__));
static_assert( sizeof( PPPOEDISC_HDR ) == 6 );

struct PPPOESESSION_HDR {
    uint8_t type : 4;
    uint8_t version : 4;
    PPPOE_CODE code;
    uint16_t session_id;
    uint16_t length;
    uint16_t ppp_protocol;
    uint8_t data[0];
}__attribute__((__packed__));
static_assert( sizeof( PPPOESESSION_HDR ) == 8 );

struct PacketPrint {
    const std::vector<uint8_t> &bytes;

    PacketPrint( const std::vector<uint8_t> &p ):
        bytes( p )
    {}
};

#endif
