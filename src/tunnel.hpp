#ifndef TUNNEL_HPP
#define TUNNEL_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "net_integer.hpp"

enum class TUNNEL_FRAME: uint16_t {
    PING = 0,
    PONG = 1,
    DISCOVERY = 2,
    SESSION = 3
};

// Largest Discovery/Session payload a receiver accepts
constexpr std::size_t TUNNEL_MAX_PAYLOAD { 65536 };
// Largest payload skipped for frames which carry nothing we use
constexpr std::size_t TUNNEL_MAX_DISCARD { 1048576 };
// 10 bytes of 7 bits each, anything longer is not a 64 bit value
constexpr unsigned VARINT_MAX_SHIFT { 63 };

struct TunnelFrame {
    uint16_t type;
    std::vector<uint8_t> payload;

    std::optional<TUNNEL_FRAME> kind() const;
};

namespace tunnel {
    std::optional<TUNNEL_FRAME> toFrameType( uint16_t type );
    void encodeVarint( uint64_t value, std::vector<uint8_t> &out );
    std::tuple<uint64_t,std::size_t,std::string> decodeVarint( const uint8_t *data, std::size_t len );
    std::vector<uint8_t> encode( TUNNEL_FRAME type, const std::vector<uint8_t> &payload, ByteOrder order );
}

// Incremental decoder for the tunnel byte stream. Feed it whatever the socket
// returned and pull complete frames out of it.
class FrameParser {
public:
    explicit FrameParser( ByteOrder o ):
        order( o )
    {}

    void append( const uint8_t *data, std::size_t len );

    // Returns the next complete frame, nothing if more bytes are needed,
    // or an error string. Errors are final for the stream.
    std::tuple<std::optional<TunnelFrame>,std::string> next();

    std::size_t buffered() const {
        return pending.size() - offset;
    }

private:
    enum class STATE: uint8_t {
        TYPE,
        LENGTH,
        PAYLOAD,
        DISCARD,
        FAILED
    };

    std::tuple<std::optional<TunnelFrame>,std::string> fail( std::string error );
    void compact();

    ByteOrder order;
    STATE state { STATE::TYPE };
    std::vector<uint8_t> pending;
    std::size_t offset { 0 };
    uint16_t type { 0 };
    uint64_t length { 0 };
    std::string error;
};

#endif
