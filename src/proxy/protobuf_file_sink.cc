/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>

#include "protobuf_file_sink.hh"
#include "int32.hh"
#include "exception.hh"

using namespace std;

ProtobufFileSink::ProtobufFileSink( const string & filename )
    : file_( SystemCall( "open " + filename,
                         open( filename.c_str(), O_WRONLY | O_CREAT | O_APPEND, 00644 ) ) )
{}

void ProtobufFileSink::write( const DNSEvent & event )
{
    string serialized;
    if ( not event.toprotobuf().SerializeToString( &serialized ) ) {
        throw runtime_error( "protobuf sink: could not serialize " + event.type_name() + " event" );
    }

    file_.write( static_cast<string>( Integer32( serialized.size() ) ) + serialized );
}
