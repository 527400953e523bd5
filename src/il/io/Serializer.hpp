//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/Serializer.hpp
// Purpose: Serializes modules to the textual IR form read back by Parser.
//
// The serializer is the on-disk writer for patch modules, so its output must be
// deterministic: the same module always prints to the same bytes.  Branch
// targets and exception handler bounds are printed as `IL_<index>` labels; only
// indices that are actually referenced receive a label.
//
// Thread Safety:
// Stateless; different threads may serialize different modules concurrently.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"

#include <ostream>
#include <string>

namespace hotswap::io
{

/// @brief Serializes modules to their textual form.
class Serializer
{
  public:
    /// @brief Write module @p m to output stream @p os.
    static void write(const hotswap::core::Module &m, std::ostream &os);

    /// @brief Serialize module @p m to a string.
    static std::string toString(const hotswap::core::Module &m);

    /// @brief Textual spelling of a type reference, e.g. `[Game]List<int32>`.
    static std::string formatType(const hotswap::core::TypeRef &t);

    /// @brief Textual spelling of a method reference operand.
    static std::string formatMethod(const hotswap::core::MethodRef &m);

    /// @brief Textual spelling of a field reference operand.
    static std::string formatField(const hotswap::core::FieldRef &f);
};

} // namespace hotswap::io
