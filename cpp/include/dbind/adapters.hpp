#ifndef __DBIND_ADAPTERS_HPP
#define __DBIND_ADAPTERS_HPP

#include <dbind/object.hpp>

#include <tuple>
#include <type_traits>

namespace dbind {

template<typename TFunc>
struct member_fn_traits;

template<typename TObj, typename TRet, typename ... TArgs>
struct member_fn_traits<TRet(TObj::*)(TArgs...)> {
    using obj_t = TObj;
    using ret_t = TRet;
    using args_t = std::tuple<std::decay_t<TArgs>...>;
};

template<typename TObj, typename TRet, typename ... TArgs>
struct member_fn_traits<TRet(TObj::*)(TArgs...) const> {
    using obj_t = const TObj;
    using ret_t = TRet;
    using args_t = std::tuple<std::decay_t<TArgs>...>;
};

namespace detail {

template<typename T>
RichStatus result_to_value(const T& result, Value* value) {
    *value = to_value(result);
    return RichStatus::success();
}

static inline RichStatus result_to_value(const RichStatus& result, Value* value) {
    *value = Value{};
    return result;
}

template<typename T>
RichStatus result_to_value(const RichStatusOr<T>& result, Value* value) {
    if (result.status().is_error()) {
        return result.status();
    }
    *value = to_value(result.value());
    return RichStatus::success();
}

template<auto Func>
typename member_fn_traits<decltype(Func)>::obj_t* downcast(Object* obj) {
    return static_cast<typename member_fn_traits<decltype(Func)>::obj_t*>(obj);
}

template<auto Func>
void method_thunk(Object* obj, const ValueList& args, MethodReply on_reply) {
    using traits = member_fn_traits<decltype(Func)>;
    using ret_t = typename traits::ret_t;

    typename traits::args_t native_args;
    RichStatus status = from_values(args, &native_args);
    if (status.is_error()) {
        on_reply.invoke(D_AMEND_ERR(status, "invalid arguments"), Value{});
        return;
    }

    auto self = downcast<Func>(obj);
    auto invoke = [self](auto& ... a) -> ret_t { return (self->*Func)(a...); };

    if constexpr (std::is_void<ret_t>::value) {
        std::apply(invoke, native_args);
        on_reply.invoke(RichStatus::success(), Value{});
    } else {
        Value result;
        status = result_to_value(std::apply(invoke, native_args), &result);
        on_reply.invoke(status, std::move(result));
    }
}

template<auto Func>
void async_method_thunk(Object* obj, const ValueList& args, MethodReply on_reply) {
    (downcast<Func>(obj)->*Func)(args, on_reply);
}

template<auto Func>
RichStatus getter_thunk(Object* obj, Value* value) {
    return result_to_value((downcast<Func>(obj)->*Func)(), value);
}

template<auto Func>
RichStatus setter_thunk(Object* obj, const Value& value) {
    using traits = member_fn_traits<decltype(Func)>;
    using arg_t = std::tuple_element_t<0, typename traits::args_t>;

    arg_t native;
    D_RET_IF_ERR(from_value(value, &native), "invalid property value");

    if constexpr (std::is_void<typename traits::ret_t>::value) {
        (downcast<Func>(obj)->*Func)(std::move(native));
        return RichStatus::success();
    } else {
        return (downcast<Func>(obj)->*Func)(std::move(native));
    }
}

}

/**
 * @brief Wraps a member function of an Object subclass into a MethodImpl.
 *
 * The arguments are converted from their D-Bus values with ValueTraits. The
 * function may return void, a convertible value (a std::tuple for several
 * results), a RichStatus or a RichStatusOr.
 */
template<auto Func>
MethodImpl method_impl() {
    return &detail::method_thunk<Func>;
}

/**
 * @brief Wraps a member function with the signature
 * `void(const ValueList& args, MethodReply on_reply)`.
 *
 * The function is responsible for invoking `on_reply` exactly once, possibly
 * after returning.
 */
template<auto Func>
MethodImpl async_method_impl() {
    return &detail::async_method_thunk<Func>;
}

/**
 * @brief Wraps a member function that takes no arguments and returns a
 * convertible value or a RichStatusOr.
 */
template<auto Func>
PropertyGetter property_getter() {
    return &detail::getter_thunk<Func>;
}

/**
 * @brief Wraps a member function that takes one convertible argument and
 * returns void or RichStatus.
 */
template<auto Func>
PropertySetter property_setter() {
    return &detail::setter_thunk<Func>;
}

}

#endif // __DBIND_ADAPTERS_HPP
