#ifndef LINK_HPP
#define LINK_HPP

#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include "log.hpp"
#include "tunnel.hpp"

using socket_tcp = boost::asio::ip::tcp::socket;
using error_code = boost::system::error_code;

class Link;

using FrameHandler = std::function<void( const std::shared_ptr<Link> &, TunnelFrame )>;
using CloseHandler = std::function<void( const std::shared_ptr<Link> &, const std::string & )>;

// One TCP connection carrying the tunnel protocol. Complete encoded frames
// are queued and written one at a time, so writers never interleave.
class Link: public std::enable_shared_from_this<Link> {
public:
    Link( socket_tcp s, Logger &l, ByteOrder o );
    ~Link();

    Link( const Link& ) = delete;
    Link& operator=( const Link& ) = delete;

    void start( FrameHandler frame_handler, CloseHandler close_handler );

    // Queue a frame for sending. False means the link is already closed.
    bool send( TUNNEL_FRAME type, const std::vector<uint8_t> &payload );
    bool send( std::shared_ptr<const std::vector<uint8_t>> encoded );

    void close();

    bool isOpen() const;

    const std::string& remote() const {
        return remote_addr;
    }

private:
    void do_read();
    void on_receive( error_code ec, std::size_t length );
    void do_write();
    void on_send( std::shared_ptr<const std::vector<uint8_t>> pkt, error_code ec, std::size_t length );
    void shutdown();
    void finish( const std::string &reason );

    socket_tcp sock;
    Logger &logger;
    ByteOrder order;
    std::string remote_addr;
    FrameParser parser;
    std::array<uint8_t,4096> buffer;
    FrameHandler on_frame;
    CloseHandler on_close;
    bool finished { false };

    mutable std::mutex write_mutex;
    std::deque<std::shared_ptr<const std::vector<uint8_t>>> tx_queue;
    bool closed { false };
};

#endif
