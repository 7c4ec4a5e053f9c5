/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <memory>

#include "tcp_listener.hh"
#include "dns_event.hh"
#include "timed_io.hh"
#include "int16.hh"

using namespace std;

const uint64_t TCPListener::DEFAULT_CLIENT_TIMEOUT_MS;

TCPListener::TCPListener( TCPSocket && socket, const UpstreamForwarder & forwarder, EventEmitter & emitter,
                          const uint64_t client_timeout_ms )
    : DNSListener( forwarder, emitter ),
      socket_( move( socket ) ),
      client_timeout_ms_( client_timeout_ms )
{
    /* make sure the socket is bound to something */
    if ( socket_.local_address().port() == 0 ) {
        throw runtime_error( "TCPListener internal error: socket must be bound" );
    }

    socket_.listen();
}

void TCPListener::handle_ready( void )
{
    shared_ptr< TCPSocket > client = make_shared< TCPSocket >( socket_.accept() );

    spawn( [this, client] () { handle_connection( *client ); } );
}

void TCPListener::handle_connection( TCPSocket & client )
{
    const Address peer = client.peer_address();
    const Deadline deadline( client_timeout_ms_ );

    string payload;
    try {
        const string length_prefix = read_exactly( client, 2, deadline, "query length" );
        if ( length_prefix.size() != 2 ) {
            throw dns_decode_error( "connection closed before the query length arrived" );
        }

        const uint16_t length = Integer16( length_prefix );
        payload = read_exactly( client, length, deadline, "query" );
        if ( payload.size() != length ) {
            throw dns_decode_error( "connection closed after " + to_string( payload.size() )
                                    + " of " + to_string( length ) + " query bytes" );
        }
    } catch ( const exception & e ) {
        /* short reads, resets and slow clients all end the connection */
        emitter_.emit( DNSEvent::invalid_request( DNSQuery( peer, Protocol::TCP, string() ), e.what() ) );
        return;
    }

    const DNSQuery query( peer, Protocol::TCP, payload );

    string reply;
    if ( relay( query, reply ) ) {
        client.send( static_cast<string>( Integer16( reply.size() ) ) + reply );
        replied( query, reply );
    }
}
