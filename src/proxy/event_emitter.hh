/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EVENT_EMITTER_HH
#define EVENT_EMITTER_HH

#include <memory>
#include <mutex>
#include <atomic>

#include "event_sink.hh"
#include "dns_event.hh"

/* hands audit events to a sink. Safe for concurrent callers; a failing
   sink costs the event, never the DNS traffic. */

class EventEmitter
{
private:
    std::mutex mutex_;
    std::unique_ptr< EventSink > sink_;
    std::atomic< unsigned int > emitted_, sink_failures_;

public:
    EventEmitter( std::unique_ptr< EventSink > && sink );

    /* never throws */
    void emit( const DNSEvent & event ) noexcept;

    unsigned int emitted( void ) const { return emitted_; }
    unsigned int sink_failures( void ) const { return sink_failures_; }

    /* forbid copying */
    EventEmitter( const EventEmitter & other ) = delete;
    EventEmitter & operator=( const EventEmitter & other ) = delete;
};

#endif /* EVENT_EMITTER_HH */
