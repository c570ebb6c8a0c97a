// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Templates.hxx"
#include "Option.hxx"
#include "util/StringAPI.hxx"

#include <iterator>

const ConfigTemplate config_param_templates[] = {
	{ "log_level" },
	{ "log_timestamp" },
	{ "date_format" },
	{ "list_size" },
	{ "start_date" },
};

static constexpr unsigned n_config_param_templates =
	std::size(config_param_templates);

static_assert(n_config_param_templates == unsigned(ConfigOption::MAX),
	      "Wrong number of config_param_templates");

ConfigOption
ParseConfigOptionName(const char *name) noexcept
{
	unsigned i = 0;
	for (; i < n_config_param_templates; ++i)
		if (StringIsEqual(config_param_templates[i].name, name))
			break;

	return ConfigOption(i);
}
