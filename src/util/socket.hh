/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef SOCKET_HH
#define SOCKET_HH

#include <cstdint>
#include <string>
#include <utility>
#include <functional>
#include <sys/types.h>
#include <sys/socket.h>

#include "address.hh"
#include "file_descriptor.hh"

/* class for network sockets (UDP and TCP) */
class Socket : public FileDescriptor
{
private:
    /* get the local or peer address the socket is connected to */
    Address get_address( const std::string & name_of_function,
                         const std::function<int(int, sockaddr *, socklen_t *)> & function ) const;

protected:
    /* default constructor */
    Socket( const int type );

    /* construct from file descriptor */
    Socket( FileDescriptor && s_fd, const int type );

    /* set socket option */
    template <typename option_type>
    void setsockopt( const int level, const int option, const option_type & option_value );

public:
    /* bind socket to a specified local address (usually to listen/accept) */
    void bind( const Address & address );

    /* connect socket to a specified peer address */
    void connect( const Address & address );

    /* accessors */
    Address local_address( void ) const;
    Address peer_address( void ) const;

    /* allow local address to be reused sooner, at the cost of some robustness */
    void set_reuseaddr( void );

    /* bound the time a blocking connect or write may take */
    void set_send_timeout( const uint64_t timeout_ms );
};

/* UDP socket */
class UDPSocket : public Socket
{
public:
    UDPSocket() : Socket( SOCK_DGRAM ) {}

    /* receive datagram and where it came from */
    std::pair< Address, std::string > recvfrom( void );

    /* send datagram to specified address */
    void sendto( const Address & destination, const std::string & payload );

    /* send datagram to connected address */
    void send( const std::string & payload );
};

/* TCP socket */
class TCPSocket : public Socket
{
private:
    /* private constructor used by accept() */
    TCPSocket( FileDescriptor && fd ) : Socket( std::move( fd ), SOCK_STREAM ) {}

public:
    TCPSocket() : Socket( SOCK_STREAM ) {}

    /* mark the socket as listening for incoming connections */
    void listen( const int backlog = 128 );

    /* accept a new incoming connection */
    TCPSocket accept( void );

    /* send all of payload, without raising SIGPIPE */
    void send( const std::string & payload );
};

#endif /* SOCKET_HH */
