/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef UPSTREAM_TARGET_HH
#define UPSTREAM_TARGET_HH

#include <string>
#include <cstdint>

#include "address.hh"

/* the resolver queries are relayed to, from "host" or "host:port" */

class UpstreamTarget
{
private:
    std::string host_;
    uint16_t port_;
    Address address_;

public:
    static const uint16_t DEFAULT_PORT = 53;

    UpstreamTarget( const std::string & host_and_port );

    const std::string & host( void ) const { return host_; }
    uint16_t port( void ) const { return port_; }

    /* resolved once, at construction */
    const Address & address( void ) const { return address_; }

    std::string str( void ) const { return host_ + ":" + std::to_string( port_ ); }
};

#endif /* UPSTREAM_TARGET_HH */
