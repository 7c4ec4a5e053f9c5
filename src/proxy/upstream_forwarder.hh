/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef UPSTREAM_FORWARDER_HH
#define UPSTREAM_FORWARDER_HH

#include <string>
#include <cstdint>
#include <stdexcept>

#include "upstream_target.hh"
#include "dns_query.hh"

class upstream_error : public std::runtime_error
{
public:
    enum class Reason { Unreachable, Timeout, MalformedReply };

private:
    Reason reason_;

public:
    upstream_error( const Reason s_reason, const std::string & s_what );

    Reason reason( void ) const { return reason_; }

    static std::string reason_name( const Reason reason );
};

/* relays one query to the upstream resolver over a fresh socket and
   returns its raw reply. Stateless; safe to share between threads. */

class UpstreamForwarder
{
private:
    const UpstreamTarget target_;
    const uint64_t timeout_ms_;

    std::string forward_udp( const std::string & query ) const;
    std::string forward_tcp( const std::string & query ) const;

public:
    static const uint64_t DEFAULT_TIMEOUT_MS = 5000;

    /* throws if timeout_ms is 0: every forward is bounded */
    UpstreamForwarder( const UpstreamTarget & target,
                       const uint64_t timeout_ms = DEFAULT_TIMEOUT_MS );

    /* throws upstream_error */
    std::string forward( const std::string & query, const Protocol protocol ) const;

    const UpstreamTarget & target( void ) const { return target_; }
    uint64_t timeout_ms( void ) const { return timeout_ms_; }
};

#endif /* UPSTREAM_FORWARDER_HH */
