#include <algorithm>
#include <cstring>

#include "tunnel.hpp"

std::optional<TUNNEL_FRAME> tunnel::toFrameType( uint16_t type ) {
    switch( static_cast<TUNNEL_FRAME>( type ) ) {
    case TUNNEL_FRAME::PING:
    case TUNNEL_FRAME::PONG:
    case TUNNEL_FRAME::DISCOVERY:
    case TUNNEL_FRAME::SESSION:
        return static_cast<TUNNEL_FRAME>( type );
    }
    return std::nullopt;
}

std::optional<TUNNEL_FRAME> TunnelFrame::kind() const {
    return tunnel::toFrameType( type );
}

void tunnel::encodeVarint( uint64_t value, std::vector<uint8_t> &out ) {
    while( value >= 0x80 ) {
        out.push_back( static_cast<uint8_t>( value & 0x7F ) | 0x80 );
        value >>= 7;
    }
    out.push_back( static_cast<uint8_t>( value ) );
}

std::tuple<uint64_t,std::size_t,std::string> tunnel::decodeVarint( const uint8_t *data, std::size_t len ) {
    uint64_t value = 0;
    unsigned shift = 0;
    for( std::size_t i = 0; i < len; i++ ) {
        auto b = data[ i ];
        value |= static_cast<uint64_t>( b & 0x7F ) << shift;
        shift += 7;
        if( ( b & 0x80 ) == 0 ) {
            return { value, i + 1, "" };
        }
        if( shift > VARINT_MAX_SHIFT ) {
            return { 0, 0, "Varint too large" };
        }
    }
    return { 0, 0, "" };
}

std::vector<uint8_t> tunnel::encode( TUNNEL_FRAME type, const std::vector<uint8_t> &payload, ByteOrder order ) {
    std::vector<uint8_t> out;
    out.reserve( sizeof( uint16_t ) + 10 + payload.size() );

    uint16_t raw_type = hton16( static_cast<uint16_t>( type ), order );
    out.resize( sizeof( raw_type ) );
    std::memcpy( out.data(), &raw_type, sizeof( raw_type ) );

    encodeVarint( payload.size(), out );
    out.insert( out.end(), payload.begin(), payload.end() );
    return out;
}

void FrameParser::append( const uint8_t *data, std::size_t len ) {
    if( state == STATE::FAILED ) {
        return;
    }
    pending.insert( pending.end(), data, data + len );
}

void FrameParser::compact() {
    if( offset == 0 ) {
        return;
    }
    pending.erase( pending.begin(), pending.begin() + offset );
    offset = 0;
}

std::tuple<std::optional<TunnelFrame>,std::string> FrameParser::fail( std::string err ) {
    state = STATE::FAILED;
    error = std::move( err );
    pending.clear();
    pending.shrink_to_fit();
    offset = 0;
    return { std::nullopt, error };
}

std::tuple<std::optional<TunnelFrame>,std::string> FrameParser::next() {
    while( true ) {
        switch( state ) {
        case STATE::FAILED:
            return { std::nullopt, error };
        case STATE::TYPE: {
            uint16_t raw_type;
            if( buffered() < sizeof( raw_type ) ) {
                compact();
                return { std::nullopt, "" };
            }
            std::memcpy( &raw_type, pending.data() + offset, sizeof( raw_type ) );
            type = ntoh16( raw_type, order );
            offset += sizeof( raw_type );
            state = STATE::LENGTH;
            break;
        }
        case STATE::LENGTH: {
            auto const &[ value, used, err ] = tunnel::decodeVarint( pending.data() + offset, buffered() );
            if( !err.empty() ) {
                return fail( err );
            }
            if( used == 0 ) {
                compact();
                return { std::nullopt, "" };
            }
            offset += used;
            length = value;

            auto kind = tunnel::toFrameType( type );
            if( kind == TUNNEL_FRAME::DISCOVERY || kind == TUNNEL_FRAME::SESSION ) {
                if( length > TUNNEL_MAX_PAYLOAD ) {
                    return fail( "Packet too large: " + std::to_string( length ) + " bytes" );
                }
                state = STATE::PAYLOAD;
            } else {
                if( length > TUNNEL_MAX_DISCARD ) {
                    return fail( "Packet too large to skip: " + std::to_string( length ) + " bytes" );
                }
                state = STATE::DISCARD;
            }
            break;
        }
        case STATE::PAYLOAD: {
            if( buffered() < length ) {
                compact();
                pending.reserve( length );
                return { std::nullopt, "" };
            }
            auto start = pending.begin() + offset;
            TunnelFrame frame { type, { start, start + length } };
            offset += length;
            state = STATE::TYPE;
            return { std::move( frame ), "" };
        }
        case STATE::DISCARD: {
            auto skip = std::min<uint64_t>( length, buffered() );
            offset += skip;
            length -= skip;
            if( length > 0 ) {
                compact();
                return { std::nullopt, "" };
            }
            state = STATE::TYPE;
            return { TunnelFrame { type, {} }, "" };
        }
        }
    }
}
