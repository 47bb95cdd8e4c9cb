#ifndef __DBIND_CALLBACK_HPP
#define __DBIND_CALLBACK_HPP

#include <type_traits>

namespace dbind {

/**
 * @brief Lightweight replacement for std::function.
 *
 * A Callback is a plain function pointer plus an opaque context pointer. It
 * never allocates and it never owns the context, so whoever hands out a
 * Callback must keep the context alive for as long as the callback can be
 * invoked.
 */
template<typename TRet, typename ... TArgs>
class Callback {
public:
    Callback() : cb_(nullptr), ctx_(nullptr) {}
    Callback(std::nullptr_t) : cb_(nullptr), ctx_(nullptr) {}
    Callback(TRet(*callback)(void*, TArgs...), void* ctx)
        : cb_(callback), ctx_(ctx) {}

    /**
     * @brief Wraps a functor (e.g. a lambda) by reference.
     *
     * The functor is not copied. It must outlive the callback.
     */
    template<typename TFunc, typename = std::enable_if_t<
        !std::is_same<std::decay_t<TFunc>, Callback>::value &&
        std::is_invocable_r<TRet, TFunc&, TArgs...>::value>>
    Callback(TFunc& func)
        : cb_(&invoke_functor<TFunc>), ctx_(&func) {}

    TRet invoke(TArgs ... args) const {
        if (cb_) {
            return (*cb_)(ctx_, args...);
        }
        return TRet();
    }

    bool has_value() const { return cb_ != nullptr; }
    explicit operator bool() const { return has_value(); }

    bool operator==(const Callback& other) const {
        return cb_ == other.cb_ && ctx_ == other.ctx_;
    }
    bool operator!=(const Callback& other) const {
        return !(*this == other);
    }

    TRet(*get_ptr() const)(void*, TArgs...) { return cb_; }
    void* get_ctx() const { return ctx_; }

private:
    template<typename TFunc>
    static TRet invoke_functor(void* ctx, TArgs ... args) {
        return (*reinterpret_cast<TFunc*>(ctx))(args...);
    }

    TRet(*cb_)(void*, TArgs...);
    void* ctx_;
};

template<typename TFunc, TFunc Func>
struct MemberCallback;

template<typename TObj, typename TRet, typename ... TArgs, TRet(TObj::*Func)(TArgs...)>
struct MemberCallback<TRet(TObj::*)(TArgs...), Func> {
    static TRet invoke(void* ctx, TArgs ... args) {
        return (reinterpret_cast<TObj*>(ctx)->*Func)(args...);
    }
    static Callback<TRet, TArgs...> with(TObj* obj) {
        return {&invoke, obj};
    }
};

template<typename TObj, typename TRet, typename ... TArgs, TRet(TObj::*Func)(TArgs...) const>
struct MemberCallback<TRet(TObj::*)(TArgs...) const, Func> {
    static TRet invoke(void* ctx, TArgs ... args) {
        return (reinterpret_cast<const TObj*>(ctx)->*Func)(args...);
    }
    static Callback<TRet, TArgs...> with(const TObj* obj) {
        return {&invoke, const_cast<TObj*>(obj)};
    }
};

}

/**
 * @brief Creates a Callback that invokes the member function `func` on `obj`.
 *
 * Usage: `MEMBER_CB(this, on_event)`
 */
#define MEMBER_CB(obj, func) \
    dbind::MemberCallback< \
        decltype(&std::remove_const_t<std::remove_reference_t<decltype(*(obj))>>::func), \
        &std::remove_const_t<std::remove_reference_t<decltype(*(obj))>>::func \
    >::with(obj)

#endif // __DBIND_CALLBACK_HPP
