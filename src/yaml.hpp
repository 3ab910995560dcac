#ifndef YAML_HPP
#define YAML_HPP

#include <yaml-cpp/yaml.h>

#include "log.hpp"

struct TunnelConf;
enum class TUNNEL_MODE: uint8_t;

namespace YAML {
    template <>
    struct convert<TUNNEL_MODE>
    {
        static Node encode(const TUNNEL_MODE &rhs);
        static bool decode(const Node &node, TUNNEL_MODE &rhs);
    };

    template <>
    struct convert<LOGL>
    {
        static Node encode(const LOGL &rhs);
        static bool decode(const Node &node, LOGL &rhs);
    };

    template <>
    struct convert<TunnelConf>
    {
        static Node encode(const TunnelConf &rhs);
        static bool decode(const Node &node, TunnelConf &rhs);
    };
}

#endif
