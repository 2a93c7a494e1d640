#pragma once

#include <string>
#include <variant>

#include <epsim_core/Types.hpp>

namespace epsim {

/** Action tagged with the control mode it is expressed in */
struct StructuredAction {
    std::string controlMode;
    vector_t payload;
};

/**
 * @brief Action passed to a control step:
 *   std::monostate   : simulate without a new action
 *   vector_t         : action under the current control mode
 *   StructuredAction : switch control mode first if it differs, then apply the payload
 */
using ActionCommand = std::variant<std::monostate, vector_t, StructuredAction>;

struct ActionSpace {
    /** Active control mode, empty without an agent */
    std::string controlMode;

    /** Expected action size under controlMode */
    long size = 0;
};

}  // namespace epsim
