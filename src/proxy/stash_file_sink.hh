/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef STASH_FILE_SINK_HH
#define STASH_FILE_SINK_HH

#include <string>

#include "event_sink.hh"
#include "file_descriptor.hh"

/* appends events to a Splunk stash file. The index, source and sourcetype
   only route the events downstream; they are written into the file header
   and not interpreted here. */

class StashFileSink : public EventSink
{
private:
    std::string index_, source_, sourcetype_;
    FileDescriptor file_;
    bool header_written_;

public:
    static const std::string EVENT_SEPARATOR;

    StashFileSink( const std::string & filename,
                   const std::string & index,
                   const std::string & source,
                   const std::string & sourcetype );

    void write( const DNSEvent & event ) override;

    /* _time=... key="value" ... */
    static std::string render( const DNSEvent & event );
};

#endif /* STASH_FILE_SINK_HH */
