// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_LOG_BACKEND_HXX
#define MAYACAL_LOG_BACKEND_HXX

#include "LogLevel.hxx"

void
SetLogThreshold(LogLevel _threshold) noexcept;

void
EnableLogTimestamp() noexcept;

#endif
