#ifndef STRING_HELPERS_HPP_
#define STRING_HELPERS_HPP_

#include <iosfwd>
#include <array>
#include <cstdint>

struct PacketPrint;
enum class PPPOE_CODE: uint8_t;
enum class PPPOE_TAG: uint16_t;
enum class PPP_PROTO : uint16_t;
enum class TUNNEL_FRAME: uint16_t;
enum class TUNNEL_MODE: uint8_t;

using mac_t = std::array<uint8_t,6>;

std::ostream& operator<<( std::ostream &stream, const mac_t &mac );
std::ostream& operator<<( std::ostream &stream, const PacketPrint &pkt );
std::ostream& operator<<( std::ostream &stream, const PPPOE_CODE &code );
std::ostream& operator<<( std::ostream &stream, const PPPOE_TAG &tag );
std::ostream& operator<<( std::ostream &stream, const PPP_PROTO &proto );
std::ostream& operator<<( std::ostream &stream, const TUNNEL_FRAME &type );
std::ostream& operator<<( std::ostream &stream, const TUNNEL_MODE &mode );

#endif
