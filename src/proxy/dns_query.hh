/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef DNS_QUERY_HH
#define DNS_QUERY_HH

#include <string>

#include "address.hh"

enum class Protocol { UDP, TCP };

inline std::string protocol_name( const Protocol protocol )
{
    return protocol == Protocol::UDP ? "udp" : "tcp";
}

/* one inbound DNS message as it came off the wire (without any TCP
   length prefix), plus where it came from */
struct DNSQuery
{
    const Address client;
    const Protocol protocol;
    const std::string payload;

    DNSQuery( const Address & s_client, const Protocol s_protocol, const std::string & s_payload )
        : client( s_client ), protocol( s_protocol ), payload( s_payload )
    {}
};

#endif /* DNS_QUERY_HH */
