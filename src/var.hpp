// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>
#include <string_view>

namespace spin {

namespace var {

// Variable traits, which describe operations on variables of the given type.
template <typename T>
struct VarTraits {
	using Storage = T;
	using Value = T;
};

// A string variable is accessed through a string view.
template <typename T>
struct VarTraits<std::basic_string<T>> {
	using Storage = std::basic_string<T>;
	using Value = std::basic_string_view<T>;
};

// Configurable variable, set from the command line.
template <typename T>
class Var {
public:
	using Traits = VarTraits<T>;
	using Storage = typename Traits::Storage;
	using Value = typename Traits::Value;

	Value get() const { return mStorage; }
	void set(Value value) { mStorage = value; }

private:
	Storage mStorage{};
};

#define DEFVAR(name, type, description) extern Var<type> name;
#include "var_def.hpp"
#undef DEFVAR

} // namespace var

// Parse the program's command-line arguments. Each argument has the form
// name=value. Invalid arguments are fatal.
void ParseCommandArguments(int argCount, char **args);

// Reset all variables to their default values.
void ResetVars();

} // namespace spin
