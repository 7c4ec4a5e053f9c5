/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef PROTOBUF_FILE_SINK_HH
#define PROTOBUF_FILE_SINK_HH

#include <string>

#include "event_sink.hh"
#include "file_descriptor.hh"

/* archive of events: each one a 32-bit big-endian length followed
   by the serialized DNSAuditProtobufs::DNSEvent */

class ProtobufFileSink : public EventSink
{
private:
    FileDescriptor file_;

public:
    ProtobufFileSink( const std::string & filename );

    void write( const DNSEvent & event ) override;
};

#endif /* PROTOBUF_FILE_SINK_HH */
