/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "udp_listener.hh"

using namespace std;

UDPListener::UDPListener( UDPSocket && socket, const UpstreamForwarder & forwarder, EventEmitter & emitter )
    : DNSListener( forwarder, emitter ),
      socket_( move( socket ) )
{
    /* make sure the socket is bound to something */
    if ( socket_.local_address().port() == 0 ) {
        throw runtime_error( "UDPListener internal error: socket must be bound" );
    }
}

void UDPListener::handle_ready( void )
{
    /* get a UDP request */
    const auto datagram = socket_.recvfrom();
    const DNSQuery query( datagram.first, Protocol::UDP, datagram.second );

    spawn( [this, query] () {
            string reply;
            if ( relay( query, reply ) ) {
                socket_.sendto( query.client, reply );
                replied( query, reply );
            }
        } );
}
