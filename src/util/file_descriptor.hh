/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef FILE_DESCRIPTOR_HH
#define FILE_DESCRIPTOR_HH

#include <string>

/* largest single read; also the largest DNS message over either transport */
static const size_t BUFFER_SIZE = 65536;

class FileDescriptor
{
private:
    int fd_;
    bool eof_;

public:
    /* construct from fd number */
    FileDescriptor( const int fd );

    /* move constructor */
    FileDescriptor( FileDescriptor && other );

    /* destructor */
    virtual ~FileDescriptor();

    /* accessors */
    const int & num( void ) const { return fd_; }
    const bool & eof( void ) const { return eof_; }
    void set_eof( void ) { eof_ = true; }

    /* read and write methods */
    std::string read( const size_t limit = BUFFER_SIZE );
    std::string::const_iterator write( const std::string & buffer, const bool write_all = true );
    std::string::const_iterator write( const std::string::const_iterator & begin,
                                       const std::string::const_iterator & end );

    /* forbid copying FileDescriptor objects or assigning them */
    FileDescriptor( const FileDescriptor & other ) = delete;
    const FileDescriptor & operator=( const FileDescriptor & other ) = delete;
};

#endif /* FILE_DESCRIPTOR_HH */
