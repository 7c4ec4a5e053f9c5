/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>

#include "stash_file_sink.hh"
#include "timestamp.hh"
#include "exception.hh"

using namespace std;

const string StashFileSink::EVENT_SEPARATOR = "==##~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~##==";

StashFileSink::StashFileSink( const string & filename,
                              const string & index,
                              const string & source,
                              const string & sourcetype )
    : index_( index ),
      source_( source ),
      sourcetype_( sourcetype ),
      file_( SystemCall( "open " + filename,
                         open( filename.c_str(), O_WRONLY | O_CREAT | O_APPEND, 00644 ) ) ),
      header_written_( false )
{}

static string stash_value( const string & value )
{
    string ret = "\"";
    for ( const auto & ch : value ) {
        if ( ch == '"' or ch == '\\' ) {
            ret.push_back( '\\' );
        }
        ret.push_back( ch );
    }
    ret.push_back( '"' );

    return ret;
}

string StashFileSink::render( const DNSEvent & event )
{
    string ret = "_time=" + timestamp_seconds( event.timestamp_ms() );

    for ( const auto & field : event.fields() ) {
        ret += " " + field.first + "=" + stash_value( field.second );
    }

    return ret;
}

void StashFileSink::write( const DNSEvent & event )
{
    string text;

    if ( not header_written_ ) {
        text = "***SPLUNK*** index=" + index_ + " source=" + source_
            + " sourcetype=" + sourcetype_ + "\n";
    }

    text += render( event ) + "\n" + EVENT_SEPARATOR + "\n";

    /* one write() per event so a record is never split across calls */
    file_.write( text );
    header_written_ = true;
}
