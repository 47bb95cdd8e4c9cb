#include <dbind/codec.hpp>
#include <dbind/name_utils.hpp>
#include <dbind/logging.hpp>

#include <limits>
#include <string.h>

using namespace dbind;

/**
 * @brief Owns a string allocated by libdbus.
 */
struct DBusString {
    explicit DBusString(char* str) : str_(str) {}
    ~DBusString() { dbus_free(str_); }
    DBusString(const DBusString&) = delete;
    DBusString& operator=(const DBusString&) = delete;
    const char* c_str() const { return str_ ? str_ : ""; }
    std::string str() const { return c_str(); }
private:
    char* str_;
};

template<typename T>
static RichStatus pack_integer(DBusMessageIter* iter, int type_id, const Value& value) {
    int64_t s = 0;
    uint64_t u = 0;
    D_RET_IF_ERR(value.get_integer((int64_t)std::numeric_limits<T>::min(),
            (uint64_t)std::numeric_limits<T>::max(), &s, &u),
            "cannot pack as '" << (char)type_id << "'");
    T val = std::is_signed<T>::value ? (T)s : (T)u;
    D_RET_IF_CODE(!dbus_message_iter_append_basic(iter, type_id, &val), Status::kBusError, "out of memory");
    return RichStatus::success();
}

static RichStatus get_string(const Value& value, std::string* str) {
    if (const std::string* s = value.get_if<std::string>()) {
        *str = *s;
    } else if (const ObjectPath* path = value.get_if<ObjectPath>()) {
        *str = *path;
    } else if (const Signature* sig = value.get_if<Signature>()) {
        *str = *sig;
    } else {
        return D_MAKE_ERR_CODE(Status::kInvalidArgument, "expected a string, got " << value);
    }
    return RichStatus::success();
}

static RichStatus pack_container_end(DBusMessageIter* iter, DBusMessageIter* sub, RichStatus status) {
    if (status.is_error()) {
        dbus_message_iter_abandon_container(iter, sub);
        return status;
    }
    D_RET_IF_CODE(!dbus_message_iter_close_container(iter, sub), Status::kBusError, "failed to close container");
    return RichStatus::success();
}

static RichStatus pack_array(DBusMessageIter* iter, DBusSignatureIter* sig, const Value& value) {
    DBusSignatureIter element_sig;
    dbus_signature_iter_recurse(sig, &element_sig);
    DBusString element_sig_str{dbus_signature_iter_get_signature(&element_sig)};
    bool is_dict = dbus_signature_iter_get_current_type(&element_sig) == DBUS_TYPE_DICT_ENTRY;

    const Array* arr = value.get_if<Array>();
    const Dict* dict = value.get_if<Dict>();
    if (is_dict) {
        D_RET_IF_CODE(!dict && !(arr && arr->elements.empty()), Status::kInvalidArgument,
                "expected a dict for signature a" << element_sig_str.c_str() << ", got " << value);
    } else {
        D_RET_IF_CODE(!arr, Status::kInvalidArgument,
                "expected an array for signature a" << element_sig_str.c_str() << ", got " << value);
    }

    DBusMessageIter sub;
    D_RET_IF_CODE(!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, element_sig_str.c_str(), &sub),
            Status::kBusError, "failed to open array container");

    RichStatus status;

    if (is_dict && dict) {
        for (size_t i = 0; i < dict->entries.size() && status.is_success(); ++i) {
            DBusSignatureIter entry_sig;
            dbus_signature_iter_recurse(&element_sig, &entry_sig);

            DBusMessageIter entry;
            if (!dbus_message_iter_open_container(&sub, DBUS_TYPE_DICT_ENTRY, nullptr, &entry)) {
                status = D_MAKE_ERR_CODE(Status::kBusError, "failed to open dict entry container");
                break;
            }
            status = pack_value(&entry, &entry_sig, dict->entries[i].key);
            if (status.is_success()) {
                dbus_signature_iter_next(&entry_sig);
                status = pack_value(&entry, &entry_sig, dict->entries[i].value);
            }
            status = pack_container_end(&sub, &entry, status);
        }
    } else if (!is_dict) {
        for (size_t i = 0; i < arr->elements.size() && status.is_success(); ++i) {
            DBusSignatureIter sig_copy = element_sig;
            status = pack_value(&sub, &sig_copy, arr->elements[i]);
            if (status.is_error()) {
                status = D_AMEND_ERR(status, "at array element " << i);
            }
        }
    }

    return pack_container_end(iter, &sub, status);
}

static RichStatus pack_struct(DBusMessageIter* iter, DBusSignatureIter* sig, const Value& value) {
    const Struct* str = value.get_if<Struct>();
    D_RET_IF_CODE(!str, Status::kInvalidArgument, "expected a struct, got " << value);

    DBusSignatureIter field_sig;
    dbus_signature_iter_recurse(sig, &field_sig);

    DBusMessageIter sub;
    D_RET_IF_CODE(!dbus_message_iter_open_container(iter, DBUS_TYPE_STRUCT, nullptr, &sub),
            Status::kBusError, "failed to open struct container");

    RichStatus status;
    size_t i = 0;
    do {
        if (i >= str->fields.size()) {
            status = D_MAKE_ERR_CODE(Status::kInvalidArgument, "struct has too few fields: " << value);
            break;
        }
        status = pack_value(&sub, &field_sig, str->fields[i++]);
    } while (status.is_success() && dbus_signature_iter_next(&field_sig));

    if (status.is_success() && i != str->fields.size()) {
        status = D_MAKE_ERR_CODE(Status::kInvalidArgument, "struct has too many fields: " << value);
    }

    return pack_container_end(iter, &sub, status);
}

static RichStatus pack_variant(DBusMessageIter* iter, const Value& value) {
    std::string inner_sig;
    const Value* inner = &value;

    if (const Variant* var = value.get_if<Variant>()) {
        D_RET_IF_CODE(!var->inner, Status::kInvalidArgument, "empty variant");
        inner_sig = var->signature;
        inner = var->inner.get();
    } else {
        D_RET_IF_ERR(guess_signature(value, &inner_sig), "cannot wrap value into a variant");
    }

    D_RET_IF_CODE(!is_single_complete_type(inner_sig), Status::kInvalidArgument,
            "invalid variant signature \"" << inner_sig << "\"");

    DBusSignatureIter sub_sig;
    dbus_signature_iter_init(&sub_sig, inner_sig.c_str());

    DBusMessageIter sub;
    D_RET_IF_CODE(!dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, inner_sig.c_str(), &sub),
            Status::kBusError, "failed to open variant container");

    return pack_container_end(iter, &sub, pack_value(&sub, &sub_sig, *inner));
}

RichStatus dbind::pack_value(DBusMessageIter* iter, DBusSignatureIter* sig, const Value& value) {
    int type_id = dbus_signature_iter_get_current_type(sig);

    switch (type_id) {
        case DBUS_TYPE_BYTE: return pack_integer<uint8_t>(iter, type_id, value);
        case DBUS_TYPE_INT16: return pack_integer<int16_t>(iter, type_id, value);
        case DBUS_TYPE_UINT16: return pack_integer<uint16_t>(iter, type_id, value);
        case DBUS_TYPE_INT32: return pack_integer<int32_t>(iter, type_id, value);
        case DBUS_TYPE_UINT32: return pack_integer<uint32_t>(iter, type_id, value);
        case DBUS_TYPE_INT64: return pack_integer<int64_t>(iter, type_id, value);
        case DBUS_TYPE_UINT64: return pack_integer<uint64_t>(iter, type_id, value);

        case DBUS_TYPE_BOOLEAN: {
            // BOOLEAN values are marshalled as 32-bit integers. Only 0 and 1 are valid.
            const bool* b = value.get_if<bool>();
            D_RET_IF_CODE(!b, Status::kInvalidArgument, "expected a bool, got " << value);
            dbus_bool_t val = *b ? TRUE : FALSE;
            D_RET_IF_CODE(!dbus_message_iter_append_basic(iter, type_id, &val), Status::kBusError, "out of memory");
            return RichStatus::success();
        }

        case DBUS_TYPE_DOUBLE: {
            double val = 0.0;
            D_RET_IF_ERR(from_value(value, &val), "cannot pack as 'd'");
            D_RET_IF_CODE(!dbus_message_iter_append_basic(iter, type_id, &val), Status::kBusError, "out of memory");
            return RichStatus::success();
        }

        case DBUS_TYPE_STRING:
        case DBUS_TYPE_OBJECT_PATH:
        case DBUS_TYPE_SIGNATURE: {
            std::string s;
            D_RET_IF_ERR(get_string(value, &s), "cannot pack as '" << (char)type_id << "'");
            // libdbus treats malformed strings as programming errors, so
            // check them before they reach it.
            D_RET_IF_CODE(type_id == DBUS_TYPE_OBJECT_PATH && !is_valid_object_path(s),
                    Status::kInvalidArgument, "invalid object path \"" << s << "\"");
            D_RET_IF_CODE(type_id == DBUS_TYPE_SIGNATURE && !is_valid_signature(s) && !s.empty(),
                    Status::kInvalidArgument, "invalid signature \"" << s << "\"");
            D_RET_IF_CODE(!dbus_validate_utf8(s.c_str(), nullptr) || s.size() != strlen(s.c_str()),
                    Status::kInvalidArgument, "string is not valid UTF-8 or contains a null character");
            const char* c_str = s.c_str();
            D_RET_IF_CODE(!dbus_message_iter_append_basic(iter, type_id, &c_str), Status::kBusError, "out of memory");
            return RichStatus::success();
        }

        case DBUS_TYPE_UNIX_FD: {
            const UnixFd* fd = value.get_if<UnixFd>();
            D_RET_IF_CODE(!fd, Status::kInvalidArgument, "expected a file descriptor, got " << value);
            int val = fd->fd;
            D_RET_IF_CODE(!dbus_message_iter_append_basic(iter, type_id, &val), Status::kBusError,
                    "failed to append file descriptor " << val);
            return RichStatus::success();
        }

        case DBUS_TYPE_ARRAY: return pack_array(iter, sig, value);
        case DBUS_TYPE_STRUCT: return pack_struct(iter, sig, value);
        case DBUS_TYPE_VARIANT: return pack_variant(iter, value);

        default:
            return D_MAKE_ERR_CODE(Status::kInvalidArgument, "unsupported type '" << (char)type_id << "'");
    }
}

RichStatus dbind::pack_message(DBusMessageIter* iter, const std::string& signature, const ValueList& args) {
    D_RET_IF_CODE(!is_valid_signature(signature), Status::kInvalidArgument,
            "invalid signature \"" << signature << "\"");
    size_t n_types = count_complete_types(signature);
    D_RET_IF_CODE(n_types != args.size(), Status::kInvalidArgument,
            "signature \"" << signature << "\" expects " << n_types << " values but got " << args.size());

    if (args.empty()) {
        return RichStatus::success();
    }

    DBusSignatureIter sig;
    dbus_signature_iter_init(&sig, signature.c_str());
    size_t i = 0;
    do {
        D_RET_IF_ERR(pack_value(iter, &sig, args[i]), "failed to pack argument " << i);
        i++;
    } while (dbus_signature_iter_next(&sig));

    return RichStatus::success();
}

RichStatus dbind::pack_message(DBusMessage* msg, const std::string& signature, const ValueList& args) {
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg, &iter);
    return pack_message(&iter, signature, args);
}

template<typename T>
static Value get_basic(DBusMessageIter* iter) {
    T val{};
    dbus_message_iter_get_basic(iter, &val);
    return Value{val};
}

RichStatus dbind::unpack_value(DBusMessageIter* iter, Value* value) {
    int type_id = dbus_message_iter_get_arg_type(iter);

    switch (type_id) {
        case DBUS_TYPE_BYTE: *value = get_basic<uint8_t>(iter); break;
        case DBUS_TYPE_INT16: *value = get_basic<int16_t>(iter); break;
        case DBUS_TYPE_UINT16: *value = get_basic<uint16_t>(iter); break;
        case DBUS_TYPE_INT32: *value = get_basic<int32_t>(iter); break;
        case DBUS_TYPE_UINT32: *value = get_basic<uint32_t>(iter); break;
        case DBUS_TYPE_INT64: *value = get_basic<int64_t>(iter); break;
        case DBUS_TYPE_UINT64: *value = get_basic<uint64_t>(iter); break;
        case DBUS_TYPE_DOUBLE: *value = get_basic<double>(iter); break;

        case DBUS_TYPE_BOOLEAN: {
            dbus_bool_t val = FALSE;
            dbus_message_iter_get_basic(iter, &val);
            D_RET_IF_CODE(val != TRUE && val != FALSE, Status::kInvalidArgument, "invalid boolean value " << val);
            *value = Value{val == TRUE};
        } break;

        case DBUS_TYPE_STRING:
        case DBUS_TYPE_OBJECT_PATH:
        case DBUS_TYPE_SIGNATURE: {
            const char* c_str = nullptr;
            dbus_message_iter_get_basic(iter, &c_str);
            D_RET_IF_CODE(!c_str, Status::kInvalidArgument, "popped invalid string");
            if (type_id == DBUS_TYPE_OBJECT_PATH) {
                *value = Value{ObjectPath{c_str}};
            } else if (type_id == DBUS_TYPE_SIGNATURE) {
                *value = Value{Signature{c_str}};
            } else {
                *value = Value{std::string{c_str}};
            }
        } break;

        case DBUS_TYPE_UNIX_FD: {
            int fd = -1;
            dbus_message_iter_get_basic(iter, &fd);
            *value = Value{UnixFd{fd}};
        } break;

        case DBUS_TYPE_ARRAY: {
            DBusMessageIter sub;
            dbus_message_iter_recurse(iter, &sub);
            if (dbus_message_iter_get_element_type(iter) == DBUS_TYPE_DICT_ENTRY) {
                Dict dict;
                while (dbus_message_iter_get_arg_type(&sub) == DBUS_TYPE_DICT_ENTRY) {
                    DBusMessageIter entry;
                    dbus_message_iter_recurse(&sub, &entry);
                    DictEntry element;
                    D_RET_IF_ERR(unpack_value(&entry, &element.key), "failed to unpack dict key");
                    dbus_message_iter_next(&entry);
                    D_RET_IF_ERR(unpack_value(&entry, &element.value), "failed to unpack dict value");
                    dict.entries.push_back(std::move(element));
                    dbus_message_iter_next(&sub);
                }
                *value = Value{std::move(dict)};
            } else {
                Array arr;
                while (dbus_message_iter_get_arg_type(&sub) != DBUS_TYPE_INVALID) {
                    Value element;
                    D_RET_IF_ERR(unpack_value(&sub, &element), "failed to unpack array element " << arr.elements.size());
                    arr.elements.push_back(std::move(element));
                    dbus_message_iter_next(&sub);
                }
                *value = Value{std::move(arr)};
            }
        } break;

        case DBUS_TYPE_STRUCT: {
            DBusMessageIter sub;
            dbus_message_iter_recurse(iter, &sub);
            Struct fields;
            while (dbus_message_iter_get_arg_type(&sub) != DBUS_TYPE_INVALID) {
                Value field;
                D_RET_IF_ERR(unpack_value(&sub, &field), "failed to unpack struct field " << fields.fields.size());
                fields.fields.push_back(std::move(field));
                dbus_message_iter_next(&sub);
            }
            *value = Value{std::move(fields)};
        } break;

        case DBUS_TYPE_VARIANT: {
            DBusMessageIter sub;
            dbus_message_iter_recurse(iter, &sub);
            DBusString signature{dbus_message_iter_get_signature(&sub)};
            Value inner;
            D_RET_IF_ERR(unpack_value(&sub, &inner), "failed to unpack variant content");
            *value = Value{Variant{signature.str(), std::move(inner)}};
        } break;

        case DBUS_TYPE_INVALID:
            return D_MAKE_ERR_CODE(Status::kInvalidArgument, "no more values");

        default:
            return D_MAKE_ERR_CODE(Status::kInvalidArgument, "unsupported type '" << (char)type_id << "'");
    }

    return RichStatus::success();
}

RichStatus dbind::unpack_message(DBusMessage* msg, ValueList* args) {
    args->clear();

    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) {
        return RichStatus::success(); // message has no arguments
    }

    while (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_INVALID) {
        Value value;
        D_RET_IF_ERR(unpack_value(&iter, &value), "failed to unpack argument " << args->size());
        args->push_back(std::move(value));
        dbus_message_iter_next(&iter);
    }

    return RichStatus::success();
}

RichStatus dbind::status_from_error_message(DBusMessage* msg) {
    const char* error_name = dbus_message_get_error_name(msg);
    std::string error_msg;

    DBusMessageIter iter;
    if (dbus_message_iter_init(msg, &iter) && dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_STRING) {
        const char* c_str = nullptr;
        dbus_message_iter_get_basic(&iter, &c_str);
        error_msg = c_str ? c_str : "";
    }

    return D_MAKE_ERR_CODE(Status::kRemoteError, error_msg)
            .with_error_name(error_name ? error_name : DBUS_ERROR_FAILED);
}

static const char* message_type_to_string(int type) {
    switch (type) {
        case DBUS_MESSAGE_TYPE_METHOD_CALL: return "method call";
        case DBUS_MESSAGE_TYPE_METHOD_RETURN: return "method return";
        case DBUS_MESSAGE_TYPE_ERROR: return "error";
        case DBUS_MESSAGE_TYPE_SIGNAL: return "signal";
        default: return "invalid";
    }
}

std::ostream& dbind::operator<<(std::ostream& stream, DBusMessage& msg) {
    const char* sender = dbus_message_get_sender(&msg);
    const char* destination = dbus_message_get_destination(&msg);
    const char* path = dbus_message_get_path(&msg);
    const char* intf = dbus_message_get_interface(&msg);
    const char* member = dbus_message_get_member(&msg);
    stream << message_type_to_string(dbus_message_get_type(&msg))
           << " from " << (sender ? sender : "(null)")
           << " to " << (destination ? destination : "(null)")
           << ": " << (path ? path : "(null)")
           << " " << (intf ? intf : "(null)")
           << "." << (member ? member : "(null)")
           << " (" << dbus_message_get_signature(&msg) << ")";
    return stream;
}
