#ifndef __DBIND_CODEC_HPP
#define __DBIND_CODEC_HPP

// helpful reference: http://www.matthew.ath.cx/misc/dbus

#include <dbind/value.hpp>
#include <dbus/dbus.h>
#include <string>

namespace dbind {

/**
 * @brief Appends one value of the complete type at `sig` to the message
 * iterator.
 *
 * The value is converted as needed: integers are range-checked against the
 * wire type, strings may be sent as object paths or signatures and plain
 * values are wrapped in a variant if the signature asks for one.
 */
RichStatus pack_value(DBusMessageIter* iter, DBusSignatureIter* sig, const Value& value);

/**
 * @brief Appends `args` to the message iterator according to `signature`.
 *
 * The number of values must match the number of complete types in the
 * signature.
 */
RichStatus pack_message(DBusMessageIter* iter, const std::string& signature, const ValueList& args);

/**
 * @brief Appends `args` to the body of `msg` according to `signature`.
 */
RichStatus pack_message(DBusMessage* msg, const std::string& signature, const ValueList& args);

/**
 * @brief Reads the value at the current iterator position. Does not advance
 * the iterator.
 */
RichStatus unpack_value(DBusMessageIter* iter, Value* value);

/**
 * @brief Reads all arguments of a message into a list of values.
 */
RichStatus unpack_message(DBusMessage* msg, ValueList* args);

/**
 * @brief Reads the error name and (optional) error message from an error
 * message and converts them into a RichStatus with code kRemoteError.
 */
RichStatus status_from_error_message(DBusMessage* msg);

std::ostream& operator<<(std::ostream& stream, DBusMessage& msg);

}

#endif // __DBIND_CODEC_HPP
