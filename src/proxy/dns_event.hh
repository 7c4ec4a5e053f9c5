/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef DNS_EVENT_HH
#define DNS_EVENT_HH

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

#include "dns_event.pb.h"
#include "dns_query.hh"
#include "dns_message.hh"

/* one audit record of a query's lifecycle. Each kind is built by its own
   factory, so it only ever carries the fields that belong to it. */

class DNSEvent
{
public:
    enum class Type { Received, Sent, Request, Reply, TruncatedReply, InvalidRequest };

    typedef std::vector< std::pair< std::string, std::string > > FieldList;

private:
    DNSAuditProtobufs::DNSEvent record_;

    DNSEvent( const Type type, const DNSQuery & query );

    static DNSEvent answer( const Type type, const DNSQuery & query,
                            const DNSMessage & reply, const DNSMessage & request );

public:
    static DNSEvent received( const DNSQuery & query );
    static DNSEvent sent( const DNSQuery & query, const std::string & reply );
    static DNSEvent request( const DNSQuery & query, const DNSMessage & request );
    static DNSEvent reply( const DNSQuery & query, const DNSMessage & reply, const DNSMessage & request );
    static DNSEvent truncated_reply( const DNSQuery & query, const DNSMessage & reply, const DNSMessage & request );
    static DNSEvent invalid_request( const DNSQuery & query, const std::string & error );

    /* rebuild from an archived record; throws if the record is inconsistent */
    explicit DNSEvent( const DNSAuditProtobufs::DNSEvent & record );

    Type type( void ) const;
    std::string type_name( void ) const;
    std::string client_address( void ) const { return record_.client_address(); }
    uint16_t client_port( void ) const { return record_.client_port(); }
    Protocol protocol( void ) const;
    uint64_t timestamp_ms( void ) const { return record_.timestamp_ms(); }

    /* ordered (key, value) pairs shared by every text rendering */
    FieldList fields( void ) const;

    /* single line of key=value pairs */
    std::string str( void ) const;

    const DNSAuditProtobufs::DNSEvent & toprotobuf( void ) const { return record_; }

    static std::string type_name( const Type type );
};

#endif /* DNS_EVENT_HH */
