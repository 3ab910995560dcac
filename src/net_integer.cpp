#include <cstring>

#include "net_integer.hpp"

ByteOrder detectByteOrder() noexcept {
    uint32_t probe = 0x01020304;
    uint8_t first;
    std::memcpy( &first, &probe, 1 );
    return first == 0x04 ? ByteOrder::LITTLE : ByteOrder::BIG;
}
