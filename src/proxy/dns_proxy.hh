/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef DNS_PROXY_HH
#define DNS_PROXY_HH

#include <memory>
#include <mutex>
#include <thread>

#include "proxy_config.hh"
#include "upstream_forwarder.hh"
#include "event_emitter.hh"
#include "udp_listener.hh"
#include "tcp_listener.hh"

/* a running proxy: one forwarder and one emitter shared by a UDP and a
   TCP listener on the same address and port, each serving on its own thread */

class ProxyHandle
{
private:
    UpstreamForwarder forwarder_;
    EventEmitter emitter_;
    UDPListener udp_listener_;
    TCPListener tcp_listener_;
    std::thread udp_thread_, tcp_thread_;
    bool stopped_;

public:
    ProxyHandle( const ProxyConfig & config, std::unique_ptr< EventSink > && sink );

    /* close both listeners, then wait for requests still in flight */
    void stop( void );

    ~ProxyHandle();

    const UpstreamForwarder & forwarder( void ) const { return forwarder_; }
    EventEmitter & emitter( void ) { return emitter_; }
    UDPListener & udp_listener( void ) { return udp_listener_; }
    TCPListener & tcp_listener( void ) { return tcp_listener_; }

    /* both transports share this port */
    uint16_t port( void ) const { return udp_listener_.local_address().port(); }

    /* forbid copying */
    ProxyHandle( const ProxyHandle & other ) = delete;
    ProxyHandle & operator=( const ProxyHandle & other ) = delete;
};

class DNSProxy
{
private:
    std::mutex mutex_;
    std::unique_ptr< ProxyHandle > handle_;

    /* caller holds mutex_ */
    ProxyHandle & launch( const ProxyConfig & config, std::unique_ptr< EventSink > && sink );

public:
    DNSProxy();

    /* starts once; while running, further calls return the existing handle
       and ignore their arguments. Throws if the sockets cannot be bound */
    ProxyHandle & start( const ProxyConfig & config );
    ProxyHandle & start( const ProxyConfig & config, std::unique_ptr< EventSink > && sink );

    /* no-op if not running */
    void stop( void );

    bool running( void );
};

#endif /* DNS_PROXY_HH */
