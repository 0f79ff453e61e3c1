// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * The payload sent from the child to the parent through the result
 * pipe.  It is a JSON document with exactly one member: either
 * {"Ok":VALUE} or {"Err":"DESCRIPTION"}.
 */

#pragma once

#include "Error.hxx"

#include <nlohmann/json.hpp>

#include <concepts>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

namespace ForkMap {

/**
 * A type which can be returned by a computation: it must be
 * convertible to and from nlohmann::json (e.g. with ADL
 * to_json()/from_json() overloads).  "void" is allowed, too.
 */
template<typename T>
concept Transportable = std::is_void_v<T> ||
	(std::is_constructible_v<nlohmann::json, const T &> &&
	 requires(const nlohmann::json &j) {
		{ j.template get<T>() } -> std::convertible_to<T>;
	 });

/**
 * Encode an already converted success value.
 *
 * Throws nlohmann::json::type_error if the value contains a string
 * which is not valid UTF-8.
 */
std::string
EncodeSuccessJson(const nlohmann::json &value);

template<typename T>
std::string
EncodeSuccess(const T &value)
{
	return EncodeSuccessJson(nlohmann::json(value));
}

/**
 * Encode a failure.  Bytes in the description which are not valid
 * UTF-8 are replaced.
 */
std::string
EncodeError(std::string_view description);

/**
 * Encode a failure described by the (full) message of the given
 * exception.
 */
std::string
EncodeError(std::exception_ptr ep);

/**
 * Parse a payload and return the success value as JSON.
 *
 * Throws #PayloadCorrupted if the payload is malformed and
 * #ComputationError if it describes a failure.
 */
nlohmann::json
DecodeSuccessJson(std::string_view payload);

template<Transportable T>
T
DecodeOutcome(std::string_view payload)
{
	auto value = DecodeSuccessJson(payload);

	if constexpr (std::is_void_v<T>) {
		if (!value.is_null())
			throw PayloadCorrupted{"Unexpected result value"};
	} else {
		try {
			return value.template get<T>();
		} catch (const nlohmann::json::exception &) {
			std::throw_with_nested(PayloadCorrupted{"Malformed result value"});
		}
	}
}

} // namespace ForkMap
