/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef LENGTH_VALUE_PARSER_HH
#define LENGTH_VALUE_PARSER_HH

#include <string>
#include <utility>

#include "int32.hh"

/* splits a byte stream of (32-bit length, value) records */

class LengthValueParser
{
private:
    Integer32 value_size_;
    std::string buffer_;
    enum { SIZE, BODY } state_;

public:
    LengthValueParser()
        : value_size_(),
          buffer_(),
          state_( SIZE )
    {};

    /* append a chunk; returns (true, value) once a complete record is buffered */
    std::pair< bool, std::string > parse( const std::string & chunk );

    /* true if a partial record is still buffered */
    bool pending( void ) const { return state_ == BODY or not buffer_.empty(); }
};

#endif /* LENGTH_VALUE_PARSER_HH */
