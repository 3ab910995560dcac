#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <string>
#include <cstdint>

#include "log.hpp"

enum class TUNNEL_MODE: uint8_t {
    CLIENT,
    SERVER
};

struct TunnelConf {
    std::string interface;
    TUNNEL_MODE mode { TUNNEL_MODE::CLIENT };
    // server: listen address, client: dial target, both as host:port
    std::string address;
    std::string allowed_ip;
    std::chrono::milliseconds keepalive_interval { std::chrono::seconds( 60 ) };
    std::chrono::milliseconds reconnect_interval { std::chrono::seconds( 5 ) };
    // Unanswered pings tolerated before the upstream is dropped, 0 disables the check
    uint32_t keepalive_miss_limit { 0 };
    LOGL log_level { LOGL::INFO };

    bool isServer() const {
        return mode == TUNNEL_MODE::SERVER;
    }

    std::string validate() const;
};

#endif
