/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EVENT_SINK_HH
#define EVENT_SINK_HH

#include "dns_event.hh"

/* destination for audit events. The emitter serializes calls to write(),
   so implementations need no locking of their own. */

class EventSink
{
public:
    /* throws on failure to record the event */
    virtual void write( const DNSEvent & event ) = 0;

    virtual ~EventSink() {}
};

#endif /* EVENT_SINK_HH */
