/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <cstring>
#include <memory>

#include "address.hh"
#include "exception.hh"
#include "util.hh"

using namespace std;

Address::Address( const sockaddr_in & s_addr )
    : addr_( s_addr )
{
}

bool Address::operator==( const Address & other ) const
{
    return addr_.sin_family == other.addr_.sin_family
        and addr_.sin_port == other.addr_.sin_port
        and addr_.sin_addr.s_addr == other.addr_.sin_addr.s_addr;
}

Address::Address( const string & ip, const uint16_t port )
    : addr_()
{
    zero( addr_ );
    addr_.sin_family = AF_INET;

    if ( 1 != inet_pton( AF_INET, ip.c_str(), &addr_.sin_addr ) ) {
        throw runtime_error( "inet_pton: invalid IPv4 address \"" + ip + "\"" );
    }

    addr_.sin_port = htons( port );
}

/* error category for getaddrinfo */
class gai_error_category : public error_category
{
public:
    const char * name( void ) const noexcept override { return "getaddrinfo"; }
    string message( const int gai_ret ) const override
    {
        return gai_strerror( gai_ret );
    }
};

Address::Address( const string & hostname, const string & service )
  : addr_()
{
    /* give hints to resolver */
    addrinfo hints;
    zero( hints );
    hints.ai_family = AF_INET;
    hints.ai_flags = AI_NUMERICSERV;

    /* prepare for the answer */
    addrinfo *res = nullptr;

    /* look up the name or names */
    const int gai_ret = getaddrinfo( hostname.c_str(), service.c_str(), &hints, &res );
    if ( gai_ret != 0 ) {
        throw tagged_error( gai_error_category(), "getaddrinfo (" + hostname + ")", gai_ret );
    }

    struct Freeaddrinfo {
        void operator()( addrinfo *x ) const { freeaddrinfo( x ); }
    };
    unique_ptr< addrinfo, Freeaddrinfo > result( res );

    /* if success, should always have at least one entry */
    if ( not result or result->ai_family != AF_INET
         or result->ai_addrlen != sizeof( addr_ ) ) {
        throw runtime_error( "getaddrinfo (" + hostname + "): no IPv4 address" );
    }

    /* assign to our private member variable */
    addr_ = *reinterpret_cast<sockaddr_in *>( result->ai_addr );
}

string Address::str( const string port_separator ) const
{
    return ip() + port_separator + to_string( port() );
}

uint16_t Address::port( void ) const
{
    return ntohs( addr_.sin_port );
}

string Address::ip( void ) const
{
    char addrstr[ INET_ADDRSTRLEN ] = {};
    if ( nullptr == inet_ntop( AF_INET, &addr_.sin_addr, addrstr, INET_ADDRSTRLEN ) ) {
        throw unix_error( "inet_ntop" );
    }

    return addrstr;
}
