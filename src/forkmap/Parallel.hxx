// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "ForkMap.hxx"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <ranges>
#include <thread>
#include <vector>

namespace ForkMap {

/**
 * Apply a function to each item of a random-access range, each call in its own child process
 * (see Run()), with up to #n_threads children at a time.
 *
 * Other items are processed even if one fails; after all children
 * have exited, the exception of the first failed item (by index) is
 * rethrown.
 *
 * @return the results in the order of #items
 */
template<std::ranges::random_access_range Range, typename F,
	 typename T=std::ranges::range_value_t<Range>>
requires std::ranges::sized_range<Range> &&
	std::invocable<F &, const T &> &&
	Transportable<std::remove_cvref_t<std::invoke_result_t<F &, const T &>>> &&
	(!std::is_void_v<std::invoke_result_t<F &, const T &>>)
auto
MapParallel(const Range &items, F f, unsigned n_threads,
	    const ForkOptions &options={})
{
	using R = std::remove_cvref_t<std::invoke_result_t<F &, const T &>>;

	const std::size_t n_items = std::ranges::size(items);
	const auto first = std::ranges::begin(items);

	std::vector<std::optional<R>> results(n_items);
	std::vector<std::exception_ptr> errors(n_items);
	std::atomic_size_t next{0};

	auto worker = [&]{
		for (std::size_t i; (i = next.fetch_add(1)) < n_items;) {
			const T &item = first[i];

			try {
				results[i].emplace(Run([&f, &item]{
					return f(item);
				}, options));
			} catch (...) {
				errors[i] = std::current_exception();
			}
		}
	};

	{
		const std::size_t n = std::clamp<std::size_t>(n_threads, 1,
							      std::max<std::size_t>(n_items, 1));

		/* std::jthread joins in its destructor, even if
		   creating another thread throws */
		std::vector<std::jthread> threads;
		threads.reserve(n);
		for (std::size_t i = 0; i < n; ++i)
			threads.emplace_back(worker);
	}

	for (auto &e : errors)
		if (e)
			std::rethrow_exception(e);

	std::vector<R> values;
	values.reserve(results.size());
	for (auto &r : results)
		values.emplace_back(std::move(*r));

	return values;
}

} // namespace ForkMap
