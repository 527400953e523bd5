//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Trap construction and formatting.  The message layout mirrors the one the
// diagnostics printer expects: kind first, then the detail in parentheses.
//
//===----------------------------------------------------------------------===//

#include "vm/Trap.hpp"

#include <sstream>

namespace hotswap::vm
{

Trap::Trap(TrapKind kind, std::string message, std::string method)
    : std::runtime_error(std::move(message)), kind_(kind), method_(std::move(method))
{
}

std::string Trap::format() const
{
    std::ostringstream os;
    os << "Trap";
    if (!method_.empty())
        os << " @" << method_;
    os << ": " << toString(kind_);
    const std::string detail = what();
    if (!detail.empty())
        os << " (" << detail << ")";
    return os.str();
}

void raise(TrapKind kind, std::string message, std::string method)
{
    throw Trap(kind, std::move(message), std::move(method));
}

} // namespace hotswap::vm
