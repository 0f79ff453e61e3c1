// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Payload.hxx"
#include "util/Exception.hxx"

using std::string_view_literals::operator""sv;

namespace ForkMap {

static constexpr auto OK_KEY = "Ok"sv;
static constexpr auto ERR_KEY = "Err"sv;

std::string
EncodeSuccessJson(const nlohmann::json &value)
{
	nlohmann::json j = nlohmann::json::object();
	j[OK_KEY] = value;
	return j.dump();
}

std::string
EncodeError(std::string_view description)
{
	nlohmann::json j = nlohmann::json::object();
	j[ERR_KEY] = description;
	return j.dump(-1, ' ', false,
		      nlohmann::json::error_handler_t::replace);
}

std::string
EncodeError(std::exception_ptr ep)
{
	return EncodeError(GetFullMessage(std::move(ep), "Unknown error"));
}

nlohmann::json
DecodeSuccessJson(std::string_view payload)
{
	if (payload.empty())
		throw PayloadCorrupted{"Child process sent no result"};

	nlohmann::json j;
	try {
		j = nlohmann::json::parse(payload);
	} catch (const nlohmann::json::parse_error &) {
		std::throw_with_nested(PayloadCorrupted{"Malformed result payload"});
	}

	if (!j.is_object() || j.size() != 1)
		throw PayloadCorrupted{"Result payload is not a tagged object"};

	if (auto i = j.find(OK_KEY); i != j.end())
		return std::move(*i);

	if (auto i = j.find(ERR_KEY); i != j.end()) {
		if (!i->is_string())
			throw PayloadCorrupted{"Error description is not a string"};

		throw ComputationError{i->get<std::string>()};
	}

	throw PayloadCorrupted{"Unknown result payload tag"};
}

} // namespace ForkMap
