/* Flow-TaskQ: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "taskq/common.hpp"

/**
 * Namespace containing the taskq::sched module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * taskq::sched might report are system errors and would not draw from this taskq::sched::error::Code set
 * of codes but rather from boost.asio's.  See documentation of returned/thrown errors for each particular API.
 *
 * ### Synopsis ###
 * To set a given #Error_code variable to a taskq::sched::error::Code value, one simply assigns it.  To check
 * whether a returned #Error_code is a given taskq::sched::error::Code value, one simply compares it with `==`.
 */
namespace taskq::sched::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via #Error_code arguments) by taskq::sched functions/methods *outside of*
 * system-triggered errors.  All notes from transport-style error sets apply: these are just `int`s in a
 * `boost::system` category of our own.
 *
 * @internal
 * ### To add a new error code ###
 * Add it here, between the last real code and the sentinel; then add its case to Category::message() and
 * Category::code_symbol() in the .cpp.  Keep the `message()` strings in sync with the doc comments here.
 */
enum class Code
{
  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Task cannot be admitted: it has already been admitted by a host scheduler (its state is not initialized).
  S_TASK_ALREADY_ENQUEUED,

  /// Task cannot be admitted: the queue is shutting down.
  S_QUEUE_SHUT_DOWN,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (`boost::system::error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * #Error_code to the (taskq::sched-specific) error code set taskq::sched::error::Code, so that one can
 * implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a taskq::sched::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "<number>", where `<number>` is the `int` value of the Code;
 *   - the symbolic name of the Code without the `S_` prefix; case-insensitive.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a taskq::sched::error::Code to a standard output stream.  The output string is compatible with the
 * reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace taskq::sched::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::taskq::sched::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
