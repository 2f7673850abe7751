#ifndef flows_hpp
#define flows_hpp

#include "brook/blueprint.hpp"
#include "brook/flow_stages.hpp"
#include "brook/graph.hpp"
#include "brook/not_used.hpp"

namespace brook::flows {

/// @brief Makes a flow passing on every element of type @T as is.
/// @note This is the usual starting point for building reusable flows.
template <element_value T>
auto of() -> flow<T, T, not_used>
{
    return flow<T, T, not_used>{
        make_blueprint(detail::make_identity_stage<T>())
    };
}

}

#endif /* flows_hpp */
