// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_CONFIG_DATA_HXX
#define MAYACAL_CONFIG_DATA_HXX

#include "Option.hxx"
#include "Param.hxx"

#include <array>
#include <cstddef>
#include <forward_list>
#include <utility>

struct ConfigData {
	std::array<std::forward_list<ConfigParam>, std::size_t(ConfigOption::MAX)> params;

	void Clear();

	auto &GetParamList(ConfigOption option) noexcept {
		return params[size_t(option)];
	}

	const auto &GetParamList(ConfigOption option) const noexcept {
		return params[size_t(option)];
	}

	void AddParam(ConfigOption option, ConfigParam &&param) noexcept;

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &list = GetParamList(option);
		return list.empty() ? nullptr : &list.front();
	}

	/**
	 * Invoke a function with the value of the setting (or
	 * nullptr if it is not set).  Exceptions thrown by the
	 * function are nested with the line number.
	 */
	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		const auto *param = GetParam(option);
		return param != nullptr
			? param->With(std::forward<F>(f))
			: f(nullptr);
	}

	[[gnu::pure]]
	const char *GetString(ConfigOption option,
			      const char *default_value=nullptr) const noexcept;

	unsigned GetPositive(ConfigOption option,
			     unsigned default_value) const;

	bool GetBool(ConfigOption option, bool default_value) const;
};

#endif
