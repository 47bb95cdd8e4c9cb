#include <dbind/value.hpp>
#include <dbus/dbus.h>

using namespace dbind;

Variant::Variant(std::string signature, Value inner)
    : signature(std::move(signature)), inner(std::make_shared<const Value>(std::move(inner))) {}

template<typename T>
static bool get_signed(const value_base& val, int64_t* result) {
    if (const T* ptr = std::get_if<T>(&val)) {
        *result = (int64_t)*ptr;
        return true;
    }
    return false;
}

template<typename T>
static bool get_unsigned(const value_base& val, uint64_t* result) {
    if (const T* ptr = std::get_if<T>(&val)) {
        *result = (uint64_t)*ptr;
        return true;
    }
    return false;
}

RichStatus Value::get_integer(int64_t min, uint64_t max, int64_t* p_signed, uint64_t* p_unsigned) const {
    int64_t s = 0;
    uint64_t u = 0;

    if (get_signed<int16_t>(base(), &s) || get_signed<int32_t>(base(), &s)
            || get_signed<int64_t>(base(), &s)) {
        D_RET_IF_CODE(s < min || (s > 0 && (uint64_t)s > max), Status::kInvalidArgument,
                "integer " << s << " out of range [" << min << ", " << max << "]");
        *p_signed = s;
        *p_unsigned = (uint64_t)s;
        return RichStatus::success();
    }

    if (get_unsigned<uint8_t>(base(), &u) || get_unsigned<uint16_t>(base(), &u)
            || get_unsigned<uint32_t>(base(), &u) || get_unsigned<uint64_t>(base(), &u)) {
        D_RET_IF_CODE(u > max, Status::kInvalidArgument,
                "integer " << u << " out of range [" << min << ", " << max << "]");
        *p_signed = (int64_t)u;
        *p_unsigned = u;
        return RichStatus::success();
    }

    return D_MAKE_ERR_CODE(Status::kInvalidArgument, "expected an integer, got " << *this);
}

bool dbind::operator==(const Dict& lhs, const Dict& rhs) {
    if (lhs.entries.size() != rhs.entries.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.entries.size(); ++i) {
        if (lhs.entries[i].key != rhs.entries[i].key || lhs.entries[i].value != rhs.entries[i].value) {
            return false;
        }
    }
    return true;
}

bool dbind::operator==(const Variant& lhs, const Variant& rhs) {
    if (lhs.signature != rhs.signature) {
        return false;
    }
    if (!lhs.inner || !rhs.inner) {
        return lhs.inner == rhs.inner;
    }
    return *lhs.inner == *rhs.inner;
}

bool dbind::operator==(const Value& lhs, const Value& rhs) {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    return std::visit([&](const auto& l) {
        using T = std::decay_t<decltype(l)>;
        return l == *std::get_if<T>(&rhs.base());
    }, lhs.base());
}

struct ValuePrinter {
    std::ostream& stream;

    void operator()(const std::monostate&) { stream << "null"; }
    void operator()(uint8_t val) { stream << (unsigned)val; }
    void operator()(bool val) { stream << (val ? "true" : "false"); }
    void operator()(const std::string& val) { stream << "\"" << val << "\""; }
    void operator()(const ObjectPath& val) { stream << "o\"" << (const std::string&)val << "\""; }
    void operator()(const Signature& val) { stream << "g\"" << (const std::string&)val << "\""; }
    void operator()(const UnixFd& val) { stream << "fd:" << val.fd; }

    void operator()(const Array& val) {
        stream << "[";
        for (size_t i = 0; i < val.elements.size(); ++i) {
            stream << (i ? ", " : "") << val.elements[i];
        }
        stream << "]";
    }

    void operator()(const Dict& val) {
        stream << "{";
        for (size_t i = 0; i < val.entries.size(); ++i) {
            stream << (i ? ", " : "") << val.entries[i].key << ": " << val.entries[i].value;
        }
        stream << "}";
    }

    void operator()(const Struct& val) {
        stream << "(";
        for (size_t i = 0; i < val.fields.size(); ++i) {
            stream << (i ? ", " : "") << val.fields[i];
        }
        stream << ")";
    }

    void operator()(const Variant& val) {
        stream << "<" << val.signature << ": ";
        if (val.inner) {
            stream << *val.inner;
        } else {
            stream << "empty";
        }
        stream << ">";
    }

    template<typename T>
    void operator()(const T& val) { stream << val; }
};

std::ostream& dbind::operator<<(std::ostream& stream, const Value& value) {
    std::visit(ValuePrinter{stream}, value.base());
    return stream;
}

std::ostream& dbind::operator<<(std::ostream& stream, const ValueList& values) {
    stream << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        stream << (i ? ", " : "") << values[i];
    }
    return stream << "]";
}

Value dbind::payload_to_value(ValueList payload) {
    if (payload.size() == 0) {
        return Value{};
    } else if (payload.size() == 1) {
        return std::move(payload[0]);
    } else {
        return Value{Struct{std::move(payload)}};
    }
}

ValueList dbind::value_to_payload(const Value& value, const std::string& signature) {
    if (value.is_null()) {
        return {};
    }
    const Struct* str = value.get_if<Struct>();
    if (str && (signature.empty() || signature[0] != DBUS_STRUCT_BEGIN_CHAR)) {
        return str->fields;
    }
    return {value};
}

RichStatus dbind::guess_signature(const Value& value, std::string* signature) {
    if (value.is<uint8_t>()) {
        *signature = DBUS_TYPE_BYTE_AS_STRING;
    } else if (value.is<bool>()) {
        *signature = DBUS_TYPE_BOOLEAN_AS_STRING;
    } else if (value.is<int16_t>()) {
        *signature = DBUS_TYPE_INT16_AS_STRING;
    } else if (value.is<uint16_t>()) {
        *signature = DBUS_TYPE_UINT16_AS_STRING;
    } else if (value.is<int32_t>()) {
        *signature = DBUS_TYPE_INT32_AS_STRING;
    } else if (value.is<uint32_t>()) {
        *signature = DBUS_TYPE_UINT32_AS_STRING;
    } else if (value.is<int64_t>()) {
        *signature = DBUS_TYPE_INT64_AS_STRING;
    } else if (value.is<uint64_t>()) {
        *signature = DBUS_TYPE_UINT64_AS_STRING;
    } else if (value.is<double>()) {
        *signature = DBUS_TYPE_DOUBLE_AS_STRING;
    } else if (value.is<std::string>()) {
        *signature = DBUS_TYPE_STRING_AS_STRING;
    } else if (value.is<ObjectPath>()) {
        *signature = DBUS_TYPE_OBJECT_PATH_AS_STRING;
    } else if (value.is<Signature>()) {
        *signature = DBUS_TYPE_SIGNATURE_AS_STRING;
    } else if (value.is<UnixFd>()) {
        *signature = DBUS_TYPE_UNIX_FD_AS_STRING;
    } else if (value.is<Variant>()) {
        *signature = DBUS_TYPE_VARIANT_AS_STRING;
    } else if (const Array* arr = value.get_if<Array>()) {
        D_RET_IF_CODE(arr->elements.empty(), Status::kInvalidArgument,
                "cannot infer the element type of an empty array");
        std::string element_sig;
        D_RET_IF_ERR(guess_signature(arr->elements[0], &element_sig), "invalid array element");
        *signature = DBUS_TYPE_ARRAY_AS_STRING + element_sig;
    } else if (const Dict* dict = value.get_if<Dict>()) {
        D_RET_IF_CODE(dict->entries.empty(), Status::kInvalidArgument,
                "cannot infer the entry type of an empty dict");
        std::string key_sig, val_sig;
        D_RET_IF_ERR(guess_signature(dict->entries[0].key, &key_sig), "invalid dict key");
        D_RET_IF_ERR(guess_signature(dict->entries[0].value, &val_sig), "invalid dict value");
        *signature = DBUS_TYPE_ARRAY_AS_STRING DBUS_DICT_ENTRY_BEGIN_CHAR_AS_STRING
                + key_sig + val_sig + DBUS_DICT_ENTRY_END_CHAR_AS_STRING;
    } else if (const Struct* str = value.get_if<Struct>()) {
        D_RET_IF_CODE(str->fields.empty(), Status::kInvalidArgument, "empty structs are not allowed");
        std::string result = DBUS_STRUCT_BEGIN_CHAR_AS_STRING;
        for (auto& field: str->fields) {
            std::string field_sig;
            D_RET_IF_ERR(guess_signature(field, &field_sig), "invalid struct field");
            result += field_sig;
        }
        *signature = result + DBUS_STRUCT_END_CHAR_AS_STRING;
    } else {
        return D_MAKE_ERR_CODE(Status::kInvalidArgument, "null has no signature");
    }
    return RichStatus::success();
}
