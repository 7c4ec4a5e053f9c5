/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EXCEPTION_HH
#define EXCEPTION_HH

#include <system_error>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <typeinfo>
#include <cstdlib>
#include <cerrno>

#include <cxxabi.h>

class tagged_error : public std::system_error
{
private:
    std::string attempt_and_error_;

public:
    tagged_error( const std::error_category & category,
                  const std::string & s_attempt,
                  const int error_code )
        : system_error( error_code, category ),
          attempt_and_error_( s_attempt + ": " + std::system_error::what() )
    {}

    const char * what( void ) const noexcept override
    {
        return attempt_and_error_.c_str();
    }
};

class unix_error : public tagged_error
{
public:
    unix_error( const std::string & s_attempt,
                const int s_errno = errno )
        : tagged_error( std::system_category(), s_attempt, s_errno )
    {}
};

/* a blocking operation ran past its deadline */
class timeout_error : public std::runtime_error
{
public:
    timeout_error( const std::string & s_attempt )
        : runtime_error( s_attempt + ": timed out" )
    {}
};

inline std::string demangled_name( const std::exception & e )
{
    int status = 0;
    char * const name = abi::__cxa_demangle( typeid( e ).name(), nullptr, nullptr, &status );
    if ( status != 0 or name == nullptr ) {
        return typeid( e ).name();
    }

    const std::string ret( name );
    free( name );
    return ret;
}

inline void print_exception( const std::exception & e, std::ostream & output = std::cerr )
{
    /* build the whole line first so concurrent handlers don't interleave */
    std::ostringstream line;
    line << "Died on " << demangled_name( e ) << ": " << e.what() << "\n";
    output << line.str() << std::flush;
}

/* for errors a request handler recovers from */
inline void print_warning( const std::string & context, const std::exception & e,
                           std::ostream & output = std::cerr )
{
    std::ostringstream line;
    line << "Warning (" << context << "): " << demangled_name( e ) << ": " << e.what() << "\n";
    output << line.str() << std::flush;
}

/* error-checking wrapper for most syscalls */
inline int SystemCall( const std::string & s_attempt, const int return_value )
{
  if ( return_value >= 0 ) {
    return return_value;
  }

  throw unix_error( s_attempt );
}

#endif
