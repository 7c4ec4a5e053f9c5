/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef RECORDING_SINK_HH
#define RECORDING_SINK_HH

#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <stdexcept>
#include <string>

#include "event_sink.hh"
#include "dns_event.hh"

/* events as they reach the sink, readable from the test thread */
class EventLog
{
private:
    std::mutex mutex_ {};
    std::condition_variable changed_ {};
    std::vector< DNSEvent > events_ {};

public:
    void add( const DNSEvent & event )
    {
        std::unique_lock<std::mutex> ul( mutex_ );
        events_.push_back( event );
        changed_.notify_all();
    }

    std::vector< DNSEvent > events( void )
    {
        std::unique_lock<std::mutex> ul( mutex_ );
        return events_;
    }

    /* false if fewer than `count` events arrived in time */
    bool wait_for( const size_t count, const uint64_t timeout_ms )
    {
        std::unique_lock<std::mutex> ul( mutex_ );
        return changed_.wait_for( ul, std::chrono::milliseconds( timeout_ms ),
                                  [&] () { return events_.size() >= count; } );
    }
};

class RecordingSink : public EventSink
{
private:
    std::shared_ptr< EventLog > log_;

public:
    RecordingSink( const std::shared_ptr< EventLog > & log ) : log_( log ) {}

    void write( const DNSEvent & event ) override { log_->add( event ); }
};

class FailingSink : public EventSink
{
public:
    void write( const DNSEvent & ) override
    {
        throw std::runtime_error( "sink unavailable" );
    }
};

/* value of one rendered field, or "" if the event has none */
inline std::string field( const DNSEvent & event, const std::string & key )
{
    for ( const auto & item : event.fields() ) {
        if ( item.first == key ) {
            return item.second;
        }
    }
    return "";
}

inline bool has_field( const DNSEvent & event, const std::string & key )
{
    for ( const auto & item : event.fields() ) {
        if ( item.first == key ) {
            return true;
        }
    }
    return false;
}

#endif /* RECORDING_SINK_HH */
