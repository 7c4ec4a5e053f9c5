/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "upstream_target.hh"
#include "ezio.hh"

using namespace std;

const uint16_t UpstreamTarget::DEFAULT_PORT;

static string host_part( const string & host_and_port )
{
    const string host = host_and_port.substr( 0, host_and_port.find( ':' ) );
    if ( host.empty() ) {
        throw runtime_error( "upstream_dns \"" + host_and_port + "\": missing host" );
    }
    return host;
}

static uint16_t port_part( const string & host_and_port )
{
    const size_t colon = host_and_port.find( ':' );
    if ( colon == string::npos or colon + 1 == host_and_port.size() ) {
        return UpstreamTarget::DEFAULT_PORT;
    }

    const long int port = myatoi( host_and_port.substr( colon + 1 ) );
    if ( port <= 0 or port > 65535 ) {
        throw runtime_error( "upstream_dns \"" + host_and_port + "\": port out of range" );
    }

    return port;
}

UpstreamTarget::UpstreamTarget( const string & host_and_port )
    : host_( host_part( host_and_port ) ),
      port_( port_part( host_and_port ) ),
      address_( host_, to_string( port_ ) )
{}
