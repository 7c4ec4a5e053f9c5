/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "length_value_parser.hh"

using namespace std;

pair< bool, string > LengthValueParser::parse( const string & chunk )
{
    buffer_.append( chunk );

    switch ( state_ ) {
    case SIZE: {
        if ( buffer_.size() < 4 ) { /* Don't have enough for the record size */
            return make_pair( false, "" );
        }
        value_size_ = static_cast<Integer32>( buffer_.substr( 0, 4 ) );
        buffer_ = buffer_.substr( 4 );
        state_ = BODY;
    }
    /* FALLTHROUGH to BODY if you are done with SIZE */

    case BODY: {
        if ( buffer_.size() < value_size_ ) { /* Don't have enough for the record */
            return make_pair( false, "" );
        }
        string value = buffer_.substr( 0, value_size_ );
        buffer_ = buffer_.substr( value_size_ );
        state_ = SIZE;
        return make_pair( true, value );
    }
    }

    return make_pair( false, "" );
}
