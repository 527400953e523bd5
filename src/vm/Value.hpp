//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Value.hpp
// Purpose: Tagged runtime value manipulated by the interpreter.
// Key invariants: Exactly one payload is meaningful, selected by kind.  A Ref
//                 points at storage kept alive by refOwner, or at a frame slot
//                 that outlives every use of the reference.
// Ownership/Lifetime: Strings and objects are shared; values copy cheaply.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace hotswap::vm
{

struct Object;
struct RuntimeMethod;

/// @brief Discriminator of Value.
enum class ValueKind : uint8_t
{
    Null,
    I32,
    I64,
    F32,
    F64,
    Str,
    Obj,
    Method,
    Ref
};

/// @brief Dynamically typed slot value.
struct Value
{
    ValueKind kind = ValueKind::Null;
    int64_t i = 0;
    float f32 = 0.0f;
    double f64 = 0.0;
    std::shared_ptr<const std::string> str;
    std::shared_ptr<Object> obj;
    RuntimeMethod *method = nullptr;
    Value *ref = nullptr;
    std::shared_ptr<void> refOwner;

    static Value null()
    {
        return Value{};
    }

    static Value i32(int32_t v);
    static Value i64(int64_t v);
    static Value float32(float v);
    static Value float64(double v);
    static Value string(std::string s);
    static Value object(std::shared_ptr<Object> o);
    /// @brief Handle to a method; invoking it follows the method's entry.
    static Value handle(RuntimeMethod *m);
    /// @brief Reference to @p target, keeping @p owner alive.
    static Value reference(Value *target, std::shared_ptr<void> owner = nullptr);

    bool isNull() const
    {
        return kind == ValueKind::Null;
    }

    /// @brief True for nonzero numbers and every non-null reference.
    bool truthy() const;

    /// @brief Integer view of I32 and I64 values.
    int64_t asInt() const;

    /// @brief Floating view of every numeric kind.
    double asDouble() const;

    /// @brief Text used by Console output and string concatenation.
    std::string toString() const;

    /// @brief Value equality used by `ceq`: numbers by value, strings by
    ///        content, objects and handles by identity.
    bool equals(const Value &other) const;
};

/// @brief Default value for a slot declared with type @p typeName.
Value defaultValueFor(const std::string &typeName);

} // namespace hotswap::vm
