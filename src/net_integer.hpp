#ifndef NET_INTEGER_HPP
#define NET_INTEGER_HPP

#include <cstdint>
#include <cstddef>

enum class ByteOrder: uint8_t {
    LITTLE,
    BIG
};

// Probes the host once, callers keep the result and pass it along
ByteOrder detectByteOrder() noexcept;

constexpr uint16_t bswap( uint16_t val ) noexcept {
    return __builtin_bswap16( val );
}

constexpr uint16_t hton16( uint16_t val, ByteOrder order ) noexcept {
    return order == ByteOrder::LITTLE ? bswap( val ) : val;
}

constexpr uint16_t ntoh16( uint16_t val, ByteOrder order ) noexcept {
    return order == ByteOrder::LITTLE ? bswap( val ) : val;
}

// Big-endian field access straight from packet bytes, independent of host order
constexpr uint16_t readBE16( const uint8_t *p ) noexcept {
    return static_cast<uint16_t>( ( p[ 0 ] << 8 ) | p[ 1 ] );
}

constexpr void writeBE16( uint8_t *p, uint16_t val ) noexcept {
    p[ 0 ] = static_cast<uint8_t>( val >> 8 );
    p[ 1 ] = static_cast<uint8_t>( val & 0xFF );
}

#endif
