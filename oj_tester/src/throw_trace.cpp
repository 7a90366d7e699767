/**
 * @file throw_trace.cpp
 * @brief 在 throw 时记录调用栈
 *
 * 覆盖 C++ 运行时的 __cxa_throw：栈展开之前先把调用栈记到 last_throw_trace，
 * 再转交 libstdc++ 的实现。递归保护据此输出抛出点的用户栈帧。
 */

#include <dlfcn.h>
#include <execinfo.h>
#include <cxxabi.h>
#include <typeinfo>
#include "core/guard.h"

namespace __cxxabiv1 {

extern "C" void __cxa_throw(void *object, std::type_info *type, void (*destructor)(void*)) {
    using cxa_throw_fn = void (*)(void*, std::type_info*, void (*)(void*));
    static cxa_throw_fn next = reinterpret_cast<cxa_throw_fn>(dlsym(RTLD_NEXT, "__cxa_throw"));

    ojt::ThrowTrace &trace = ojt::last_throw_trace;
    trace.object = object;
    trace.depth = backtrace(trace.frames, ojt::MAX_THROW_FRAMES);

    next(object, type, destructor);
    __builtin_unreachable();
}

} // namespace __cxxabiv1
