/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <vector>

#include "socket.hh"
#include "exception.hh"
#include "util.hh"

using namespace std;

/* default constructor for socket of (subclassed) domain and type */
Socket::Socket( const int type )
    : FileDescriptor( SystemCall( "socket", socket( AF_INET, type, 0 ) ) )
{}

/* construct from file descriptor */
Socket::Socket( FileDescriptor && fd, const int type )
    : FileDescriptor( move( fd ) )
{
    int actual_value;
    socklen_t len = sizeof( actual_value );
    SystemCall( "getsockopt", getsockopt( num(), SOL_SOCKET, SO_TYPE, &actual_value, &len ) );

    if ( (len != sizeof( actual_value )) or (actual_value != type) ) {
        throw runtime_error( "socket type mismatch" );
    }
}

/* get the local or peer address the socket is connected to */
Address Socket::get_address( const std::string & name_of_function,
                             const std::function<int(int, sockaddr *, socklen_t *)> & function ) const
{
    sockaddr_in address;
    socklen_t size = sizeof( address );

    SystemCall( name_of_function, function( num(),
                                             reinterpret_cast<sockaddr *>( &address ),
                                             &size ) );

    return Address( address );
}

Address Socket::local_address( void ) const
{
    return get_address( "getsockname", getsockname );
}

Address Socket::peer_address( void ) const
{
    return get_address( "getpeername", getpeername );
}

/* bind socket to a specified local address (usually to listen/accept) */
void Socket::bind( const Address & address )
{
    SystemCall( "bind " + address.str(), ::bind( num(),
                                                 &address.raw_sockaddr(),
                                                 sizeof( address.raw_sockaddr_in() ) ) );
}

/* connect socket to a specified peer address */
void Socket::connect( const Address & address )
{
    SystemCall( "connect " + address.str(), ::connect( num(),
                                                       &address.raw_sockaddr(),
                                                       sizeof( address.raw_sockaddr_in() ) ) );
}

/* receive datagram and where it came from */
pair< Address, string > UDPSocket::recvfrom( void )
{
    static const ssize_t RECEIVE_MTU = 65536;

    /* receive source address and payload */
    sockaddr_in datagram_source_address;
    vector< char > buffer( RECEIVE_MTU );

    socklen_t fromlen = sizeof( datagram_source_address );

    const ssize_t recv_len = SystemCall( "recvfrom",
                                         ::recvfrom( num(),
                                                     buffer.data(),
                                                     buffer.size(),
                                                     MSG_TRUNC,
                                                     reinterpret_cast<sockaddr *>( &datagram_source_address ),
                                                     &fromlen ) );

    if ( recv_len > RECEIVE_MTU ) {
        throw runtime_error( "recvfrom (oversized datagram)" );
    }

    return make_pair( Address( datagram_source_address ),
                      string( buffer.data(), recv_len ) );
}

/* send datagram to specified address */
void UDPSocket::sendto( const Address & destination, const string & payload )
{
    const ssize_t bytes_sent =
        SystemCall( "sendto", ::sendto( num(),
                                        payload.data(),
                                        payload.size(),
                                        0,
                                        &destination.raw_sockaddr(),
                                        sizeof( destination.raw_sockaddr_in() ) ) );

    if ( size_t( bytes_sent ) != payload.size() ) {
        throw runtime_error( "datagram payload too big for sendto()" );
    }
}

/* send datagram to connected address */
void UDPSocket::send( const string & payload )
{
    const ssize_t bytes_sent =
        SystemCall( "send", ::send( num(),
                                    payload.data(),
                                    payload.size(),
                                    0 ) );

    if ( size_t( bytes_sent ) != payload.size() ) {
        throw runtime_error( "datagram payload too big for send()" );
    }
}

/* mark the socket as listening for incoming connections */
void TCPSocket::listen( const int backlog )
{
    SystemCall( "listen", ::listen( num(), backlog ) );
}

/* accept a new incoming connection */
TCPSocket TCPSocket::accept( void )
{
    return TCPSocket( FileDescriptor( SystemCall( "accept", ::accept( num(), nullptr, nullptr ) ) ) );
}

/* send the whole payload; a peer that has gone away is an error, not SIGPIPE */
void TCPSocket::send( const string & payload )
{
    auto it = payload.begin();

    while ( it != payload.end() ) {
        const ssize_t bytes_sent =
            SystemCall( "send", ::send( num(),
                                        &*it,
                                        payload.end() - it,
                                        MSG_NOSIGNAL ) );

        if ( bytes_sent == 0 ) {
            throw runtime_error( "send returned 0" );
        }

        it += bytes_sent;
    }
}

/* set socket option */
template <typename option_type>
void Socket::setsockopt( const int level, const int option, const option_type & option_value )
{
    SystemCall( "setsockopt", ::setsockopt( num(), level, option,
                                            &option_value, sizeof( option_value ) ) );
}

/* allow local address to be reused sooner, at the cost of some robustness */
void Socket::set_reuseaddr( void )
{
    setsockopt( SOL_SOCKET, SO_REUSEADDR, int( true ) );
}

void Socket::set_send_timeout( const uint64_t timeout_ms )
{
    timeval timeout;
    zero( timeout );
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = ( timeout_ms % 1000 ) * 1000;

    setsockopt( SOL_SOCKET, SO_SNDTIMEO, timeout );
}
