#include "diagnostics.hpp"

namespace brook::detail {

diagnostics::diagnostics(std::ostream& os, bool enabled):
    stream{enabled? &os: nullptr}
{
    // Intentionally empty.
}

auto diagnostics::write(const std::string& line) -> void
{
    const std::lock_guard lock{mutex};
    if (stream) {
        *stream << line << '\n';
        stream->flush();
    }
}

auto diagnostics::close() -> void
{
    const std::lock_guard lock{mutex};
    stream = nullptr;
}

}
