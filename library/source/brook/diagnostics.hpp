#ifndef diagnostics_hpp
#define diagnostics_hpp

#include <mutex>
#include <ostream>
#include <string>

namespace brook::detail {

/// @brief Line oriented writer to a diagnostics stream shared by runs that
///   execute concurrently.
/// @note After <code>close</code> lines are dropped. That lets runs outlive
///   the materializer that started them.
struct diagnostics
{
    diagnostics(std::ostream& os, bool enabled);

    auto write(const std::string& line) -> void;
    auto close() -> void;

private:
    std::mutex mutex;
    std::ostream* stream{};
};

}

#endif /* diagnostics_hpp */
