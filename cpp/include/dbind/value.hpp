#ifndef __DBIND_VALUE_HPP
#define __DBIND_VALUE_HPP

#include <dbind/rich_status.hpp>

#include <stdint.h>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <iostream>

namespace dbind {

struct Value;
struct DictEntry;

using ValueList = std::vector<Value>;

struct ObjectPath : std::string {
    ObjectPath() = default;
    explicit ObjectPath(std::string str) : std::string(std::move(str)) {}
    explicit ObjectPath(const char* str) : std::string(str) {}
};

struct Signature : std::string {
    Signature() = default;
    explicit Signature(std::string str) : std::string(std::move(str)) {}
    explicit Signature(const char* str) : std::string(str) {}
};

struct UnixFd {
    int fd = -1;
};

struct Array {
    ValueList elements;
};

struct Dict {
    std::vector<DictEntry> entries;
};

struct Struct {
    ValueList fields;
};

/**
 * @brief A boxed value together with the signature it is to be sent with.
 */
struct Variant {
    Variant() = default;
    Variant(std::string signature, Value inner);

    std::string signature;
    std::shared_ptr<const Value> inner;
};

using value_base = std::variant<
    std::monostate,
    uint8_t, bool, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t,
    double, std::string, ObjectPath, Signature, UnixFd,
    Array, Dict, Struct, Variant
>;

/**
 * @brief Dynamically typed value that can hold anything the D-Bus type system
 * can express.
 *
 * A default constructed Value is null (std::monostate). Null stands for "no
 * value": an empty reply payload or an argument that was not supplied.
 */
struct Value : value_base {
    Value() = default;
    Value(std::monostate) {}
    Value(uint8_t val) : value_base(std::in_place_type<uint8_t>, val) {}
    Value(bool val) : value_base(std::in_place_type<bool>, val) {}
    Value(int16_t val) : value_base(std::in_place_type<int16_t>, val) {}
    Value(uint16_t val) : value_base(std::in_place_type<uint16_t>, val) {}
    Value(int32_t val) : value_base(std::in_place_type<int32_t>, val) {}
    Value(uint32_t val) : value_base(std::in_place_type<uint32_t>, val) {}
    Value(int64_t val) : value_base(std::in_place_type<int64_t>, val) {}
    Value(uint64_t val) : value_base(std::in_place_type<uint64_t>, val) {}
    Value(double val) : value_base(std::in_place_type<double>, val) {}
    Value(const char* val) : value_base(std::in_place_type<std::string>, val) {}
    Value(std::string val) : value_base(std::in_place_type<std::string>, std::move(val)) {}
    Value(ObjectPath val) : value_base(std::in_place_type<ObjectPath>, std::move(val)) {}
    Value(Signature val) : value_base(std::in_place_type<Signature>, std::move(val)) {}
    Value(UnixFd val) : value_base(std::in_place_type<UnixFd>, val) {}
    Value(Array val) : value_base(std::in_place_type<Array>, std::move(val)) {}
    Value(Dict val) : value_base(std::in_place_type<Dict>, std::move(val)) {}
    Value(Struct val) : value_base(std::in_place_type<Struct>, std::move(val)) {}
    Value(Variant val) : value_base(std::in_place_type<Variant>, std::move(val)) {}

    const value_base& base() const { return *this; }
    value_base& base() { return *this; }

    bool is_null() const { return index() == 0; }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(base()); }

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&base()); }

    template<typename T>
    T* get_if() { return std::get_if<T>(&base()); }

    /**
     * @brief Reads an integer of any width out of this value.
     *
     * Fails if the value is not an integer or if it does not fit into
     * [min, max].
     */
    RichStatus get_integer(int64_t min, uint64_t max, int64_t* p_signed, uint64_t* p_unsigned) const;
};

struct DictEntry {
    Value key;
    Value value;
};

bool operator==(const Value& lhs, const Value& rhs);
static inline bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }
static inline bool operator==(const UnixFd& lhs, const UnixFd& rhs) { return lhs.fd == rhs.fd; }
static inline bool operator==(const ObjectPath& lhs, const ObjectPath& rhs) { return (const std::string&)lhs == (const std::string&)rhs; }
static inline bool operator==(const Signature& lhs, const Signature& rhs) { return (const std::string&)lhs == (const std::string&)rhs; }
static inline bool operator==(const Array& lhs, const Array& rhs) { return lhs.elements == rhs.elements; }
bool operator==(const Dict& lhs, const Dict& rhs);
static inline bool operator==(const Struct& lhs, const Struct& rhs) { return lhs.fields == rhs.fields; }
bool operator==(const Variant& lhs, const Variant& rhs);

std::ostream& operator<<(std::ostream& stream, const Value& value);
std::ostream& operator<<(std::ostream& stream, const ValueList& values);

/**
 * @brief Converts a message payload (list of top level arguments) to a single
 * value: no arguments yield null, one argument yields that argument and
 * multiple arguments yield a Struct.
 */
Value payload_to_value(ValueList payload);

/**
 * @brief Converts a single value to a message payload for the given
 * signature.
 *
 * Null yields an empty payload. A Struct is spread into its fields unless the
 * signature starts with a struct, in which case the Struct is itself the
 * first argument. Any other value becomes a one-element payload.
 */
ValueList value_to_payload(const Value& value, const std::string& signature);

/**
 * @brief Guesses the signature of a value. Used to wrap plain values into
 * variants. Fails for empty arrays and dicts whose element type cannot be
 * inferred.
 */
RichStatus guess_signature(const Value& value, std::string* signature);


/* Conversion between Value and C++ types ------------------------------------*/

/**
 * @brief Converts between native C++ types and Value.
 *
 * Each specialization provides:
 *  - `static Value to_value(const T& val)`
 *  - `static RichStatus from_value(const Value& value, T* val)`
 */
template<typename T, typename = void>
struct ValueTraits;

template<typename T>
Value to_value(const T& val) {
    return ValueTraits<T>::to_value(val);
}

template<typename T>
RichStatus from_value(const Value& value, T* val) {
    return ValueTraits<T>::from_value(value, val);
}

template<size_t BYTES, bool SIGNED> struct integer_alternative;
template<> struct integer_alternative<1, false> { using type = uint8_t; };
template<> struct integer_alternative<1, true> { using type = int16_t; };
template<> struct integer_alternative<2, false> { using type = uint16_t; };
template<> struct integer_alternative<2, true> { using type = int16_t; };
template<> struct integer_alternative<4, false> { using type = uint32_t; };
template<> struct integer_alternative<4, true> { using type = int32_t; };
template<> struct integer_alternative<8, false> { using type = uint64_t; };
template<> struct integer_alternative<8, true> { using type = int64_t; };

template<typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>> {
    using alternative = typename integer_alternative<sizeof(T), std::is_signed<T>::value>::type;

    static Value to_value(const T& val) {
        return Value{(alternative)val};
    }

    static RichStatus from_value(const Value& value, T* val) {
        int64_t s = 0;
        uint64_t u = 0;
        D_RET_IF_ERR(value.get_integer((int64_t)std::numeric_limits<T>::min(),
                (uint64_t)std::numeric_limits<T>::max(), &s, &u), "integer conversion failed");
        *val = std::is_signed<T>::value ? (T)s : (T)u;
        return RichStatus::success();
    }
};

template<typename T>
struct ValueTraits<T, std::enable_if_t<std::is_floating_point<T>::value>> {
    static Value to_value(const T& val) {
        return Value{(double)val};
    }

    static RichStatus from_value(const Value& value, T* val) {
        if (const double* d = value.get_if<double>()) {
            *val = (T)*d;
            return RichStatus::success();
        }
        int64_t s = 0;
        uint64_t u = 0;
        D_RET_IF_ERR(value.get_integer(std::numeric_limits<int64_t>::min(),
                std::numeric_limits<uint64_t>::max(), &s, &u), "expected a number, got " << value);
        *val = value.is<uint64_t>() ? (T)u : (T)s;
        return RichStatus::success();
    }
};

/**
 * @brief Used for alternatives that are stored as they are.
 */
template<typename T>
struct IdentityValueTraits {
    static Value to_value(const T& val) {
        return Value{val};
    }

    static RichStatus from_value(const Value& value, T* val) {
        const T* ptr = value.get_if<T>();
        D_RET_IF_CODE(!ptr, Status::kInvalidArgument, "unexpected value type: " << value);
        *val = *ptr;
        return RichStatus::success();
    }
};

template<> struct ValueTraits<bool> : IdentityValueTraits<bool> {};
template<> struct ValueTraits<UnixFd> : IdentityValueTraits<UnixFd> {};
template<> struct ValueTraits<Array> : IdentityValueTraits<Array> {};
template<> struct ValueTraits<Dict> : IdentityValueTraits<Dict> {};
template<> struct ValueTraits<Struct> : IdentityValueTraits<Struct> {};
template<> struct ValueTraits<Variant> : IdentityValueTraits<Variant> {};

// Strings, object paths and signatures are interchangeable on the C++ side.
template<typename T>
struct StringValueTraits {
    static Value to_value(const T& val) {
        return Value{val};
    }

    static RichStatus from_value(const Value& value, T* val) {
        if (const std::string* str = value.get_if<std::string>()) {
            *val = T{*str};
        } else if (const ObjectPath* path = value.get_if<ObjectPath>()) {
            *val = T{(const std::string&)*path};
        } else if (const Signature* sig = value.get_if<Signature>()) {
            *val = T{(const std::string&)*sig};
        } else {
            return D_MAKE_ERR_CODE(Status::kInvalidArgument, "expected a string, got " << value);
        }
        return RichStatus::success();
    }
};

template<> struct ValueTraits<std::string> : StringValueTraits<std::string> {};
template<> struct ValueTraits<ObjectPath> : StringValueTraits<ObjectPath> {};
template<> struct ValueTraits<Signature> : StringValueTraits<Signature> {};

template<>
struct ValueTraits<Value> {
    static Value to_value(const Value& val) {
        return val;
    }

    static RichStatus from_value(const Value& value, Value* val) {
        *val = value;
        return RichStatus::success();
    }
};

template<typename TElement>
struct ValueTraits<std::vector<TElement>> {
    static Value to_value(const std::vector<TElement>& val) {
        Array arr;
        arr.elements.reserve(val.size());
        for (auto& el: val) {
            arr.elements.push_back(ValueTraits<TElement>::to_value(el));
        }
        return Value{std::move(arr)};
    }

    static RichStatus from_value(const Value& value, std::vector<TElement>* val) {
        const Array* arr = value.get_if<Array>();
        D_RET_IF_CODE(!arr, Status::kInvalidArgument, "expected an array, got " << value);
        val->clear();
        for (size_t i = 0; i < arr->elements.size(); ++i) {
            TElement el{};
            D_RET_IF_ERR(ValueTraits<TElement>::from_value(arr->elements[i], &el), "at array element " << i);
            val->push_back(std::move(el));
        }
        return RichStatus::success();
    }
};

template<typename TMap>
struct MapValueTraits {
    using key_type = typename TMap::key_type;
    using mapped_type = typename TMap::mapped_type;

    static Value to_value(const TMap& val) {
        Dict dict;
        for (auto& it: val) {
            dict.entries.push_back({ValueTraits<key_type>::to_value(it.first),
                                    ValueTraits<mapped_type>::to_value(it.second)});
        }
        return Value{std::move(dict)};
    }

    static RichStatus from_value(const Value& value, TMap* val) {
        val->clear();
        const Dict* dict = value.get_if<Dict>();
        if (!dict) {
            // An empty array is how an empty dict arrives if no type
            // information was available.
            const Array* arr = value.get_if<Array>();
            D_RET_IF_CODE(!arr || arr->elements.size(), Status::kInvalidArgument, "expected a dict, got " << value);
            return RichStatus::success();
        }
        for (auto& entry: dict->entries) {
            key_type k{};
            mapped_type v{};
            D_RET_IF_ERR(ValueTraits<key_type>::from_value(entry.key, &k), "invalid dict key");
            D_RET_IF_ERR(ValueTraits<mapped_type>::from_value(entry.value, &v), "invalid dict value");
            (*val)[std::move(k)] = std::move(v);
        }
        return RichStatus::success();
    }
};

template<typename TKey, typename TVal>
struct ValueTraits<std::map<TKey, TVal>> : MapValueTraits<std::map<TKey, TVal>> {};

template<typename TKey, typename TVal>
struct ValueTraits<std::unordered_map<TKey, TVal>> : MapValueTraits<std::unordered_map<TKey, TVal>> {};

template<typename ... Ts>
struct ValueTraits<std::tuple<Ts...>> {
    static Value to_value(const std::tuple<Ts...>& val) {
        return to_value_impl(val, std::make_index_sequence<sizeof...(Ts)>());
    }

    static RichStatus from_value(const Value& value, std::tuple<Ts...>* val) {
        const Struct* str = value.get_if<Struct>();
        D_RET_IF_CODE(!str, Status::kInvalidArgument, "expected a struct, got " << value);
        return from_values(str->fields, val);
    }

    static RichStatus from_values(const ValueList& values, std::tuple<Ts...>* val) {
        D_RET_IF_CODE(values.size() != sizeof...(Ts), Status::kInvalidArgument,
                "expected " << sizeof...(Ts) << " values, got " << values.size());
        return from_values_impl(values, val, std::make_index_sequence<sizeof...(Ts)>());
    }

private:
    template<size_t ... Is>
    static Value to_value_impl(const std::tuple<Ts...>& val, std::index_sequence<Is...>) {
        return Value{Struct{{ValueTraits<Ts>::to_value(std::get<Is>(val))...}}};
    }

    template<size_t ... Is>
    static RichStatus from_values_impl(const ValueList& values, std::tuple<Ts...>* val, std::index_sequence<Is...>) {
        RichStatus status;
        // Stops at the first failing element.
        bool dummy[] = { true, (status.is_success() && (status = element_from_value<Is>(values[Is], val)).is_success())... };
        (void)dummy;
        return status;
    }

    template<size_t I>
    static RichStatus element_from_value(const Value& value, std::tuple<Ts...>* val) {
        using element_t = std::tuple_element_t<I, std::tuple<Ts...>>;
        D_RET_IF_ERR(ValueTraits<element_t>::from_value(value, &std::get<I>(*val)), "at argument " << I);
        return RichStatus::success();
    }
};

/**
 * @brief Converts a list of values to a tuple of native values, element by
 * element.
 */
template<typename ... Ts>
RichStatus from_values(const ValueList& values, std::tuple<Ts...>* val) {
    return ValueTraits<std::tuple<Ts...>>::from_values(values, val);
}

}

#endif // __DBIND_VALUE_HPP
