#include <cstdlib> // for std::free
#include <memory> // for std::unique_ptr

#include <cxxabi.h> // for abi::__cxa_demangle

#include "brook/element.hpp"

namespace brook {

namespace {

struct freer {
    auto operator()(char* p) const noexcept -> void {
        std::free(p); // NOLINT(cppcoreguidelines-no-malloc)
    }
};

}

auto demangled_name(const element_type& type) -> std::string
{
    auto status = 0;
    const auto name = std::unique_ptr<char, freer>{
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status)
    };
    return (status == 0 && name)? std::string{name.get()}: type.name();
}

auto operator<<(std::ostream& os, const port_type& value) -> std::ostream&
{
    if (value) {
        os << demangled_name(*value);
    }
    else {
        os << "closed";
    }
    return os;
}

}
