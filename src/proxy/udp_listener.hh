/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef UDP_LISTENER_HH
#define UDP_LISTENER_HH

#include "dns_listener.hh"
#include "socket.hh"

/* one query per datagram, one reply per datagram, malformed input
   dropped without a reply */

class UDPListener : public DNSListener
{
private:
    UDPSocket socket_;

protected:
    FileDescriptor & listening_socket( void ) override { return socket_; }
    void handle_ready( void ) override;

public:
    /* takes a socket that is already bound */
    UDPListener( UDPSocket && socket, const UpstreamForwarder & forwarder, EventEmitter & emitter );

    Protocol protocol( void ) const override { return Protocol::UDP; }
    Address local_address( void ) const override { return socket_.local_address(); }
};

#endif /* UDP_LISTENER_HH */
