/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef CONSOLE_SINK_HH
#define CONSOLE_SINK_HH

#include <ostream>

#include "event_sink.hh"

/* class to print each event to screen as a line of key=value pairs */

class ConsoleSink : public EventSink
{
private:
    std::ostream & output_;

public:
    ConsoleSink( std::ostream & output );

    void write( const DNSEvent & event ) override;
};

#endif /* CONSOLE_SINK_HH */
