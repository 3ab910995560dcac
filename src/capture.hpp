#ifndef CAPTURE_HPP
#define CAPTURE_HPP

#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <linux/if_packet.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/basic_raw_socket.hpp>
#include <boost/asio/generic/raw_protocol.hpp>

#include "log.hpp"
#include "net_integer.hpp"

using io_service = boost::asio::io_context;

using ForwardHandler = std::function<void( std::vector<uint8_t> )>;
using EndpointErrorHandler = std::function<void( const std::string & )>;

// Producer and consumer of raw PPPoE frames on one side of the tunnel
class FrameEndpoint {
public:
    virtual ~FrameEndpoint() = default;

    // Installs the handler every accepted frame is passed to, replacing the previous one
    virtual void setForward( ForwardHandler handler ) = 0;
    virtual void injectPacket( const std::vector<uint8_t> &pkt ) = 0;
    virtual void close() = 0;
};

enum class CAPTURE_ERROR: uint8_t {
    INTERFACE_NOT_FOUND,
    SOCKET_ERROR,
    BIND_ERROR
};

class CaptureError: public std::runtime_error {
public:
    CaptureError( CAPTURE_ERROR k, const std::string &what ):
        std::runtime_error( what ),
        kind( k )
    {}

    CAPTURE_ERROR kind;
};

// Link-layer socket bound to one interface and one PPPoE EtherType
class CaptureEndpoint: public FrameEndpoint {
public:
    CaptureEndpoint( io_service &io, Logger &l, const std::string &ifname, uint16_t ethertype, bool is_server, ByteOrder order );
    ~CaptureEndpoint() override;

    CaptureEndpoint( const CaptureEndpoint& ) = delete;
    CaptureEndpoint& operator=( const CaptureEndpoint& ) = delete;

    void setForward( ForwardHandler handler ) override;
    void setErrorHandler( EndpointErrorHandler handler );
    void injectPacket( const std::vector<uint8_t> &pkt ) override;
    void close() override;

private:
    void start_receive();
    void receive( boost::system::error_code ec );
    void process( std::vector<uint8_t> pkt );
    void trace_tags( const std::vector<uint8_t> &pkt );
    void die( const std::string &reason );

    Logger &logger;
    std::string ifname;
    std::string ep_name;
    uint16_t ethertype;
    bool is_server;
    LOGS subsystem;
    sockaddr_ll link_addr;
    std::array<uint8_t,2048> pktbuf;
    boost::asio::basic_raw_socket<boost::asio::generic::raw_protocol> raw_sock;
    std::atomic_bool closed { false };

    std::mutex handler_mutex;
    ForwardHandler forward;
    EndpointErrorHandler on_error;
};

#endif
