/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <iostream>
#include <stdexcept>

#include "proxy_config.hh"
#include "console_sink.hh"
#include "stash_file_sink.hh"
#include "protobuf_file_sink.hh"
#include "ezio.hh"

using namespace std;

void ProxyConfig::validate( void ) const
{
    if ( port < 0 or port > 65535 ) {
        throw runtime_error( "port: missing or out of range (" + to_string( port ) + ")" );
    }

    if ( timeout_ms == 0 ) {
        throw runtime_error( "timeout_ms: must be positive" );
    }

    if ( upstream_dns.empty() ) {
        throw runtime_error( "upstream_dns: missing" );
    }

    if ( output_format != OutputFormat::Text and output.empty() ) {
        throw runtime_error( "output: a file is needed for stash and protobuf output" );
    }
}

Address ProxyConfig::listen_address( void ) const
{
    return Address( address.empty() ? "0.0.0.0" : address, to_string( port ) );
}

ProxyConfig::OutputFormat ProxyConfig::parse_output_format( const string & name )
{
    if ( name == "stash" ) {
        return OutputFormat::Stash;
    } else if ( name == "text" ) {
        return OutputFormat::Text;
    } else if ( name == "protobuf" ) {
        return OutputFormat::Protobuf;
    }

    throw runtime_error( "unknown output format \"" + name + "\" (expected stash, text or protobuf)" );
}

int ProxyConfig::parse_port( const string & text )
{
    const long int port = myatoi( text );
    if ( port < 0 or port > 65535 ) {
        throw runtime_error( "port out of range: " + text );
    }

    return port;
}

unique_ptr< EventSink > make_event_sink( const ProxyConfig & config )
{
    switch ( config.output_format ) {
    case ProxyConfig::OutputFormat::Stash:
        return unique_ptr< EventSink >( new StashFileSink( config.output, config.index,
                                                           config.source, config.sourcetype ) );
    case ProxyConfig::OutputFormat::Protobuf:
        return unique_ptr< EventSink >( new ProtobufFileSink( config.output ) );
    case ProxyConfig::OutputFormat::Text:
        return unique_ptr< EventSink >( new ConsoleSink( cout ) );
    }

    throw runtime_error( "make_event_sink: unknown output format" );
}
