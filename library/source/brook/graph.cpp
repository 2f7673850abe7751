#include <utility> // for std::move

#include "brook/graph.hpp"

namespace brook {

auto append(const blueprint& upstream, stage value) -> blueprint
{
    return connect(upstream, make_blueprint(std::move(value)),
                   combiners::keep_left());
}

}
