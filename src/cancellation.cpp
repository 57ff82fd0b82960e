#include "cancellation.hh"
#include "exception.hh"

namespace {

volatile std::sig_atomic_t cancel_requested = 0;

void handleTerminationSignal( int ) {
	cancel_requested = 1;
}

}



namespace cancellation {

void installSignalHandlers() {
	std::signal( SIGINT, handleTerminationSignal );
	std::signal( SIGTERM, handleTerminationSignal );
}



void request() {
	cancel_requested = 1;
}



bool requested() {
	return cancel_requested;
}



void reset() {
	cancel_requested = 0;
}



void checkpoint() {
	if( cancel_requested ) BOOST_THROW_EXCEPTION( CancellationError() );
}

}
