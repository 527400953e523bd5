//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Runtime.hpp
// Purpose: The live process: loads modules, executes bytecode and exposes
//          redirectable method entry points.
// Key invariants: Modules are never unloaded; every RuntimeType and
//                 RuntimeMethod lives until the Runtime is destroyed.
//                 Traps never escape the public invoke API.
// Ownership/Lifetime: Owns loaded modules, runtime types and methods, static
//                     storage and the field indirection table.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Interpreter for the bytecode IR with method detouring support.
/// @details The Runtime is a stack machine over the IR's instruction stream.
///          References inside a module are resolved lazily at first
///          execution and cached per instruction.  Each method carries an
///          entry slot; calls, newobj and handle invocations follow that
///          slot, so redirect() takes effect for call sites already
///          resolved and for method handles captured earlier.
///
/// @section concurrency Concurrency model
/// Multiple host threads may invoke methods concurrently.  Module loading,
/// resolution caches and console output are internally synchronized.
/// Instance fields and ordinary statics are not; added fields go through
/// FieldResolver, which locks per slot.

#pragma once

#include "il/core/Module.hpp"
#include "support/diag_expected.hpp"
#include "vm/FieldResolver.hpp"
#include "vm/Redirector.hpp"
#include "vm/RuntimeTypes.hpp"
#include "vm/Value.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace hotswap::vm
{

struct Frame;

/// @brief Name of the built-in module holding the core library.
inline constexpr const char *kCoreModule = "core";

/// @brief Resolved field operand.
struct FieldBinding
{
    RuntimeType *owner = nullptr;
    uint32_t index = 0;
    bool isStatic = false;
    hotswap::core::Visibility visibility = hotswap::core::Visibility::Public;
};

/// @brief In-process interpreter standing in for the managed host.
class Runtime : public Redirector
{
  public:
    /// @param out Destination of core.Console output; std::cout when null.
    explicit Runtime(std::ostream *out = nullptr);
    ~Runtime() override;

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    /// @brief Register @p module, lay out its types and run type initializers.
    /// @param path Source file recorded for diagnostics.
    hotswap::support::Expected<LoadedModule *> load(hotswap::core::Module module,
                                                    std::string path = {});

    /// @brief Parse the textual module at @p path and load it.
    hotswap::support::Expected<LoadedModule *> loadFile(const std::string &path);

    LoadedModule *findModule(const std::string &name) const;
    RuntimeType *findType(const std::string &module, const std::string &type) const;

    /// @brief Method by full signature, e.g. `int32 Game.Player::F()`.
    RuntimeMethod *findMethod(const std::string &module, const std::string &signature) const;

    /// @brief Invoke @p m with @p args, receiver first for instance methods.
    ///        Follows the method's entry.
    hotswap::support::Expected<Value> invoke(RuntimeMethod *m, std::vector<Value> args);

    hotswap::support::Expected<Value> invoke(const std::string &module,
                                             const std::string &signature,
                                             std::vector<Value> args);

    /// @brief Invoke a method handle previously obtained from Value::handle
    ///        or `ldftn`.
    hotswap::support::Expected<Value> invokeHandle(const Value &handle, std::vector<Value> args);

    /// @brief Allocate an instance of @p type and run its constructor taking
    ///        @p args.
    hotswap::support::Expected<Value> newObject(const std::string &module,
                                                const std::string &type,
                                                std::vector<Value> args = {});

    [[nodiscard]] hotswap::support::Expected<void> redirect(RuntimeMethod *original,
                                                            RuntimeMethod *replacement) override;

    /// @brief Let @p m access members hidden from its declaring type.
    void disableVisibilityChecks(RuntimeMethod *m);

    /// @brief Method that actually executes when @p m is called.
    RuntimeMethod *resolveEntry(RuntimeMethod *m) const;

    FieldResolver &fields()
    {
        return fields_;
    }

    /// @brief Write @p text to the console stream.
    void write(const std::string &text);

    /// @name Core library registration
    /// @{
    RuntimeType *defineBuiltinType(const std::string &name,
                                   const std::string &base,
                                   const std::vector<std::string> &fields = {});
    RuntimeMethod *defineNative(RuntimeType *owner,
                                const std::string &signature,
                                bool isStatic,
                                int arity,
                                NativeFn fn);
    /// @}

    /// @name Interpreter entry points used by natives
    /// Throw Trap or ManagedException on failure.
    /// @{
    Value call(RuntimeMethod *m, std::vector<Value> &args, const hotswap::core::MethodRef &site);
    Value callHandle(const Value &handle, std::vector<Value> &args);
    Value callSlot(const Value &receiver, const std::string &slotKey, std::vector<Value> &args);
    /// @}

  private:
    Value execute(RuntimeMethod *m, std::vector<Value> &args);

    RuntimeType *resolveType(const hotswap::core::TypeRef &ref, LoadedModule &from) const;
    RuntimeMethod *resolveMethod(const hotswap::core::Instr &in, LoadedModule &from);
    FieldBinding resolveField(const hotswap::core::Instr &in, LoadedModule &from);
    void checkAccess(const RuntimeMethod *caller,
                     const RuntimeType *owner,
                     hotswap::core::Visibility vis,
                     const std::string &member) const;

    hotswap::support::Expected<void> layout(LoadedModule &lm);
    RuntimeMethod *newMethod();

    std::unordered_map<std::string, std::unique_ptr<LoadedModule>> modules_;
    std::deque<RuntimeType> types_;
    std::deque<RuntimeMethod> methods_;
    mutable std::recursive_mutex loadMutex_;

    std::unordered_map<const hotswap::core::Instr *, RuntimeMethod *> methodCache_;
    std::unordered_map<const hotswap::core::Instr *, FieldBinding> fieldCache_;
    std::mutex cacheMutex_;

    FieldResolver fields_;
    std::ostream *out_;
    std::mutex outMutex_;
};

/// @brief Managed exception thrown by the `throw` opcode.
struct ManagedException
{
    Value value;
};

/// @brief Populate the built-in `core` module of @p rt.
void installCoreLibrary(Runtime &rt);

} // namespace hotswap::vm
