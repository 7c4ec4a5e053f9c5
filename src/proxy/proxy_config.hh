/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef PROXY_CONFIG_HH
#define PROXY_CONFIG_HH

#include <string>
#include <memory>
#include <cstdint>

#include "address.hh"
#include "event_sink.hh"

/* everything the proxy needs to start, as handed over by the host program */

struct ProxyConfig
{
    enum class OutputFormat { Stash, Text, Protobuf };

    int port = -1;                      /* required; 0 picks an ephemeral port */
    std::string address {};             /* empty = all interfaces */
    std::string upstream_dns {};        /* "host" or "host:port" */

    uint64_t timeout_ms = 5000;         /* upstream; must be positive */
    uint64_t client_timeout_ms = 5000;  /* TCP clients; 0 = unbounded */

    /* passed through to the sink */
    std::string index = "default";
    std::string source = "dns_proxy";
    std::string sourcetype = "dns_proxy";

    OutputFormat output_format = OutputFormat::Text;
    std::string output {};

    /* throws std::runtime_error naming the first bad field */
    void validate( void ) const;

    Address listen_address( void ) const;

    static OutputFormat parse_output_format( const std::string & name );

    /* decimal port number, 0 to 65535 */
    static int parse_port( const std::string & text );
};

/* the sink the configuration asks for */
std::unique_ptr< EventSink > make_event_sink( const ProxyConfig & config );

#endif /* PROXY_CONFIG_HH */
