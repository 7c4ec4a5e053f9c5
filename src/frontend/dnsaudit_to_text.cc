/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <iostream>

#include "dns_event.hh"
#include "length_value_parser.hh"
#include "file_descriptor.hh"
#include "timestamp.hh"
#include "exception.hh"

using namespace std;

int main( int argc, char *argv[] )
{
    try {
        if ( argc != 2 ) {
            throw runtime_error( "Usage: " + string( argv[ 0 ] ) + " dnsaudit_archive_file" );
        }

        const string archive_file = argv[ 1 ];

        FileDescriptor fd( SystemCall( "open " + archive_file, open( archive_file.c_str(), O_RDONLY ) ) );

        LengthValueParser parser;
        unsigned int count = 0;

        while ( not fd.eof() ) {
            auto record = parser.parse( fd.read() );

            /* one chunk can hold many records */
            while ( record.first ) {
                DNSAuditProtobufs::DNSEvent protobuf;
                if ( not protobuf.ParseFromString( record.second ) ) {
                    throw runtime_error( archive_file + ": invalid event record #" + to_string( count ) );
                }

                const DNSEvent event( protobuf );
                cout << timestamp_seconds( event.timestamp_ms() ) << " " << event.str() << endl;
                count++;

                record = parser.parse( "" );
            }
        }

        if ( parser.pending() ) {
            throw runtime_error( archive_file + ": truncated after " + to_string( count ) + " events" );
        }

        return EXIT_SUCCESS;
    } catch ( const exception & e ) {
        print_exception( e );
        return EXIT_FAILURE;
    }
}
