#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <tuple>
#include <vector>
#include <cstdint>

#include <boost/asio/ip/tcp.hpp>

std::tuple<std::string,uint16_t,std::string> splitHostPort( const std::string &address );
std::string endpointIP( const boost::asio::ip::tcp::endpoint &endpoint );
bool isClientAllowed( const std::string &allowed_ip, const boost::asio::ip::tcp::endpoint &remote );
std::string hexString( const std::vector<uint8_t> &pkt );

#endif
