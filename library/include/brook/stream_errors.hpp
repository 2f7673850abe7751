#ifndef stream_errors_hpp
#define stream_errors_hpp

#include <stdexcept> // for std::runtime_error

namespace brook {

/// @brief Failure of stages needing an element from a stream that had none.
/// @see sinks::head.
struct empty_stream_error: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// @brief Failure of runs stopped by their owner before completing.
/// @note Destroying a <code>run_handle</code> of an unfinished run, or
///   shutting down the materializer that adopted it, fails the run with
///   this.
struct abrupt_termination: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

}

#endif /* stream_errors_hpp */
