//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Redirector.hpp
// Purpose: Narrow interface for entry-point redirection.
// Key invariants: After a successful redirect, every call and handle
//                 invocation of original executes replacement.
// Ownership/Lifetime: Does not own either method.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

namespace hotswap::vm
{

struct RuntimeMethod;

/// @brief Redirects a method's call entry point to another method.
class Redirector
{
  public:
    virtual ~Redirector() = default;

    /// @brief Make calls to @p original execute @p replacement.
    /// @return Error describing why the redirection was rejected.
    [[nodiscard]] virtual hotswap::support::Expected<void> redirect(RuntimeMethod *original,
                                                                    RuntimeMethod *replacement) = 0;
};

} // namespace hotswap::vm
