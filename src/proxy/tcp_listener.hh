/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TCP_LISTENER_HH
#define TCP_LISTENER_HH

#include <cstdint>

#include "dns_listener.hh"
#include "socket.hh"

/* one length-prefixed query per connection; the connection is closed
   after the reply or after an error */

class TCPListener : public DNSListener
{
private:
    TCPSocket socket_;
    const uint64_t client_timeout_ms_;

    void handle_connection( TCPSocket & client );

protected:
    FileDescriptor & listening_socket( void ) override { return socket_; }
    void handle_ready( void ) override;

public:
    static const uint64_t DEFAULT_CLIENT_TIMEOUT_MS = 5000;

    /* takes a socket that is already bound, and starts listening on it.
       A client_timeout_ms of 0 lets a client take as long as it likes */
    TCPListener( TCPSocket && socket, const UpstreamForwarder & forwarder, EventEmitter & emitter,
                 const uint64_t client_timeout_ms = DEFAULT_CLIENT_TIMEOUT_MS );

    Protocol protocol( void ) const override { return Protocol::TCP; }
    Address local_address( void ) const override { return socket_.local_address(); }
};

#endif /* TCP_LISTENER_HH */
