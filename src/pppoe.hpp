#ifndef PPPOE_HPP_
#define PPPOE_HPP_

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "packet.hpp"

namespace pppoe {
    std::string checkFrame( const std::vector<uint8_t> &pkt );
    bool acceptFrame( std::vector<uint8_t> &pkt, uint16_t ethertype, bool is_server );
    PPPOE_CODE getCode( const std::vector<uint8_t> &pkt );
    uint16_t getSessionId( const std::vector<uint8_t> &pkt );
    std::tuple<std::map<PPPOE_TAG,std::string>,std::string> parseTags( const std::vector<uint8_t> &pkt );
    void rewriteHostUniq( std::vector<uint8_t> &pkt );
    std::string sessionEvent( const std::vector<uint8_t> &pkt, bool lcp_only = false );
}

#endif
