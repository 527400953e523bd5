//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// The built-in `core` library: object root, console output, string helpers,
// exceptions, delegates, the state machine driver and the field resolver
// entry points patched code calls for added fields.
//
//===----------------------------------------------------------------------===//

#include "vm/Object.hpp"
#include "vm/Runtime.hpp"
#include "vm/Trap.hpp"

namespace hotswap::vm
{

using hotswap::core::MethodRef;

namespace
{

/// @brief Owning type named by the first generic argument of @p site.
std::string ownerOf(const MethodRef &site)
{
    if (site.genericArgs.empty())
        raise(TrapKind::InvalidOperation, site.name + " requires the owning type as generic argument");
    return site.genericArgs.front().fullName();
}

std::string nameArg(const Value &v, const MethodRef &site)
{
    if (v.kind != ValueKind::Str)
        raise(TrapKind::InvalidCast, site.name + " expects a field name");
    return *v.str;
}

Object &instanceArg(const Value &v, const MethodRef &site)
{
    if (v.kind != ValueKind::Obj)
        raise(TrapKind::NullReference, site.name + " on a null instance");
    return *v.obj;
}

void installFieldResolver(Runtime &rt)
{
    RuntimeType *t = rt.defineBuiltinType("core.FieldResolver", "core.Object");
    rt.defineNative(t, "object core.FieldResolver::Get<TOwner>(object,string)", true, 2,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    {
                        return r.fields().get(ownerOf(site), instanceArg(a[0], site),
                                              nameArg(a[1], site));
                    });
    rt.defineNative(t, "void core.FieldResolver::Store<TOwner>(object,object,string)", true, 3,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    {
                        r.fields().store(ownerOf(site), instanceArg(a[0], site),
                                         nameArg(a[2], site), a[1]);
                        return Value::null();
                    });
    rt.defineNative(t, "object core.FieldResolver::GetRef<TOwner>(object,string)", true, 2,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    {
                        return r.fields().ref(ownerOf(site), instanceArg(a[0], site),
                                              nameArg(a[1], site));
                    });
    rt.defineNative(t, "object core.FieldResolver::GetStatic<TOwner>(string)", true, 1,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    { return r.fields().getStatic(ownerOf(site), nameArg(a[0], site)); });
    rt.defineNative(t, "void core.FieldResolver::StoreStatic<TOwner>(object,string)", true, 2,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    {
                        r.fields().storeStatic(ownerOf(site), nameArg(a[1], site), a[0]);
                        return Value::null();
                    });
    rt.defineNative(t, "object core.FieldResolver::GetStaticRef<TOwner>(string)", true, 1,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    { return r.fields().staticRef(ownerOf(site), nameArg(a[0], site)); });
}

} // namespace

void installCoreLibrary(Runtime &rt)
{
    RuntimeType *object = rt.defineBuiltinType("core.Object", "");
    rt.defineNative(object, "void core.Object::.ctor()", false, 1,
                    [](Runtime &, const MethodRef &, std::vector<Value> &) { return Value::null(); });
    rt.defineNative(object, "string core.Object::ToString()", false, 1,
                    [](Runtime &, const MethodRef &, std::vector<Value> &a)
                    { return Value::string(a[0].toString()); });

    RuntimeType *console = rt.defineBuiltinType("core.Console", "core.Object");
    rt.defineNative(console, "void core.Console::WriteLine(object)", true, 1,
                    [](Runtime &r, const MethodRef &, std::vector<Value> &a)
                    {
                        r.write(a[0].toString() + "\n");
                        return Value::null();
                    });
    rt.defineNative(console, "void core.Console::Write(object)", true, 1,
                    [](Runtime &r, const MethodRef &, std::vector<Value> &a)
                    {
                        r.write(a[0].toString());
                        return Value::null();
                    });

    RuntimeType *str = rt.defineBuiltinType("core.String", "core.Object");
    rt.defineNative(str, "string core.String::Concat(object,object)", true, 2,
                    [](Runtime &, const MethodRef &, std::vector<Value> &a)
                    { return Value::string(a[0].toString() + a[1].toString()); });
    rt.defineNative(str, "int32 core.String::Length(string)", true, 1,
                    [](Runtime &, const MethodRef &site, std::vector<Value> &a)
                    {
                        if (a[0].kind != ValueKind::Str)
                            raise(TrapKind::NullReference, site.name + " of a non-string");
                        return Value::i32(static_cast<int32_t>(a[0].str->size()));
                    });

    RuntimeType *exception = rt.defineBuiltinType("core.Exception", "core.Object", {"message"});
    rt.defineNative(exception, "void core.Exception::.ctor(string)", false, 2,
                    [](Runtime &, const MethodRef &site, std::vector<Value> &a)
                    {
                        instanceArg(a[0], site).fields[0] = a[1];
                        return Value::null();
                    });
    rt.defineNative(exception, "string core.Exception::get_Message()", false, 1,
                    [](Runtime &, const MethodRef &site, std::vector<Value> &a)
                    { return instanceArg(a[0], site).fields[0]; });

    // fields: target, method handle
    RuntimeType *delegate = rt.defineBuiltinType("core.Delegate", "core.Object", {"target", "fn"});
    rt.defineNative(delegate, "void core.Delegate::.ctor(object,method)", false, 3,
                    [](Runtime &, const MethodRef &site, std::vector<Value> &a)
                    {
                        if (a[2].kind != ValueKind::Method)
                            raise(TrapKind::InvalidCast, "delegate requires a method handle");
                        Object &self = instanceArg(a[0], site);
                        self.fields[0] = a[1];
                        self.fields[1] = a[2];
                        return Value::null();
                    });
    rt.defineNative(delegate, "object core.Delegate::Invoke()", false, -1,
                    [](Runtime &r, const MethodRef &site, std::vector<Value> &a)
                    {
                        Object &self = instanceArg(a.at(0), site);
                        const Value fn = self.fields[1];
                        std::vector<Value> args;
                        // A static target bound to an instance takes it as
                        // its first argument, as patch wrappers do.
                        if (fn.kind == ValueKind::Method &&
                            (!fn.method->isStatic || !self.fields[0].isNull()))
                            args.push_back(self.fields[0]);
                        args.insert(args.end(), a.begin() + 1, a.end());
                        return r.callHandle(fn, args);
                    });

    rt.defineBuiltinType("core.IStateMachine", "");
    RuntimeType *driver = rt.defineBuiltinType("core.StateMachine", "core.Object");
    rt.defineNative(driver, "void core.StateMachine::Start<TStateMachine>(object)", true, 1,
                    [](Runtime &r, const MethodRef &, std::vector<Value> &a)
                    {
                        std::vector<Value> none;
                        r.callSlot(a[0], "MoveNext()", none);
                        return Value::null();
                    });

    installFieldResolver(rt);
}

} // namespace hotswap::vm
