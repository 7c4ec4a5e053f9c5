/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef DNS_LISTENER_HH
#define DNS_LISTENER_HH

#include <string>
#include <utility>
#include <functional>
#include <mutex>
#include <condition_variable>

#include "file_descriptor.hh"
#include "address.hh"
#include "dns_query.hh"
#include "upstream_forwarder.hh"
#include "event_emitter.hh"

/* serving loop shared by the UDP and TCP listeners: waits on the bound
   socket, hands each request to its own thread, and runs the
   received -> request -> reply -> sent lifecycle for it */

class DNSListener
{
public:
    enum class State { Bound, Serving, Stopped };

private:
    std::mutex mutex_;
    std::condition_variable in_flight_changed_;
    unsigned int in_flight_;
    State state_;

    /* written by stop() to wake the serving loop */
    std::pair< FileDescriptor, FileDescriptor > stop_pipe_;

    void finished( void );

protected:
    const UpstreamForwarder & forwarder_;
    EventEmitter & emitter_;

    /* forward one query upstream, emitting its events along the way.
       Returns true and fills `reply` if there is something to send back */
    bool relay( const DNSQuery & query, std::string & reply );

    /* after the reply has gone out */
    void replied( const DNSQuery & query, const std::string & reply );

    /* run a request handler on its own thread */
    void spawn( const std::function<void(void)> & handler );

    virtual FileDescriptor & listening_socket( void ) = 0;

    /* the listening socket is readable */
    virtual void handle_ready( void ) = 0;

public:
    DNSListener( const UpstreamForwarder & forwarder, EventEmitter & emitter );

    /* blocks until stop() */
    void serve( void );

    /* callable from any thread */
    void stop( void );

    /* wait for request handlers still running */
    void drain( void );

    State state( void );
    unsigned int in_flight( void );

    virtual Protocol protocol( void ) const = 0;
    virtual Address local_address( void ) const = 0;

    virtual ~DNSListener() {}

    /* forbid copying */
    DNSListener( const DNSListener & other ) = delete;
    DNSListener & operator=( const DNSListener & other ) = delete;
};

#endif /* DNS_LISTENER_HH */
