// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// Logging macros, modeled after Go's log/slog package. For example:
//
//     LOG(Info, "Created window.", log::Attr{"width", width});

#include "log_standard.hpp" // IWYU pragma: export

// Write a record at the given level, with optional attributes.
#define LOG(level, ...) \
	::spin::log::Record{::spin::log::Level::level, LOG_LOCATION, __VA_ARGS__} \
		.Log()

// Exit with an error if the condition is false. Not removed in release builds.
#define CHECK(condition) \
	(void)((!!(condition)) || \
	       (::spin::log::Record::CheckFailure(LOG_LOCATION, #condition) \
	            .Fail(), \
	        0))

// Write an error record and exit. Used for initialization errors, which the
// demos never recover from.
#define FAIL(...) \
	::spin::log::Record{::spin::log::Level::Error, LOG_LOCATION, __VA_ARGS__} \
		.Fail()
