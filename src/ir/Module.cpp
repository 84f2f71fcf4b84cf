//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Module.cpp
// Purpose: Implements body lookup for modules.
// Key invariants: Lookup is by exact name.
// Ownership/Lifetime: Returned pointers are owned by the module.
//
//===----------------------------------------------------------------------===//

#include "ir/Module.hpp"

namespace ember::ir
{

const Body *Module::findBody(std::string_view name) const
{
    for (const auto &body : bodies)
    {
        if (body.name == name)
            return &body;
    }
    return nullptr;
}

} // namespace ember::ir
