// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "var.hpp"

#include "log.hpp"

#include <charconv>
#include <optional>

namespace spin {

namespace var {

#define DEFVAR(name, type, description) Var<type> name;
#include "var_def.hpp"
#undef DEFVAR

} // namespace var

namespace {

// Iterator over command-line arguments.
class ArgIterator {
public:
	ArgIterator(int argCount, char **args)
		: mArg{args}, mEnd{args + argCount} {}

	// Get the next command-line argument.
	std::string_view Next() {
		if (mArg == mEnd)
			return {};
		return *mArg++;
	}

	bool HasArguments() const { return mArg != mEnd; }

private:
	char **mArg;
	char **mEnd;
};

std::optional<bool> ParseBool(std::string_view value) {
	if (value == "0" || value == "n" || value == "no" || value == "off" ||
	    value == "false") {
		return false;
	}
	if (value == "1" || value == "y" || value == "yes" || value == "on" ||
	    value == "true") {
		return true;
	}
	return std::nullopt;
}

std::optional<int> ParseInt(std::string_view value) {
	int result;
	const char *end = value.data() + value.size();
	std::from_chars_result r = std::from_chars(value.data(), end, result);
	if (r.ec != std::errc{} || r.ptr != end) {
		return std::nullopt;
	}
	return result;
}

// Kinds of variable data.
enum class Kind {
	Bool,
	Int,
	String,
};

// Definition for a configuration variable.
class VarDefinition {
public:
	constexpr VarDefinition(std::string_view name, var::Var<bool> *value)
		: mName{name}, mKind{Kind::Bool} {
		mData.boolVar = value;
	}
	constexpr VarDefinition(std::string_view name, var::Var<int> *value)
		: mName{name}, mKind{Kind::Int} {
		mData.intVar = value;
	}
	constexpr VarDefinition(std::string_view name, var::Var<std::string> *value)
		: mName{name}, mKind{Kind::String} {
		mData.stringVar = value;
	}

	std::string_view name() const { return mName; }

	void Set(std::string_view string) const {
		switch (mKind) {
		case Kind::Bool: {
			std::optional<bool> parsed = ParseBool(string);
			if (!parsed.has_value()) {
				FAIL("Invalid boolean.", log::Attr{"var", mName},
				     log::Attr{"value", string});
			}
			mData.boolVar->set(*parsed);
		} break;
		case Kind::Int: {
			std::optional<int> parsed = ParseInt(string);
			if (!parsed.has_value()) {
				FAIL("Invalid integer.", log::Attr{"var", mName},
				     log::Attr{"value", string});
			}
			mData.intVar->set(*parsed);
		} break;
		case Kind::String:
			mData.stringVar->set(string);
			break;
		}
	}

	void Reset() const {
		switch (mKind) {
		case Kind::Bool:
			mData.boolVar->set(false);
			break;
		case Kind::Int:
			mData.intVar->set(0);
			break;
		case Kind::String:
			mData.stringVar->set({});
			break;
		}
	}

private:
	std::string_view mName;
	Kind mKind;
	union {
		var::Var<bool> *boolVar;
		var::Var<int> *intVar;
		var::Var<std::string> *stringVar;
	} mData;
};

const VarDefinition VarDefinitions[] = {
#define DEFVAR(name, type, description) {#name, &var::name},
#include "var_def.hpp"
#undef DEFVAR
};

const VarDefinition *LookupVar(std::string_view name) {
	for (const VarDefinition &definition : VarDefinitions) {
		if (definition.name() == name) {
			return &definition;
		}
	}
	return nullptr;
}

// Apply variables that configure other subsystems.
void ApplyVars() {
	std::string_view levelName = var::LogLevel.get();
	if (!levelName.empty()) {
		std::optional<log::Level> level = log::ParseLevel(levelName);
		if (!level.has_value()) {
			FAIL("Invalid log level.", log::Attr{"value", levelName});
		}
		log::SetMinimumLevel(*level);
	}
	if (var::FrameLimit.get() < 0) {
		FAIL("Frame limit must not be negative.",
		     log::Attr{"value", var::FrameLimit.get()});
	}
}

} // namespace

void ParseCommandArguments(int argCount, char **args) {
	ArgIterator iter{argCount, args};
	while (iter.HasArguments()) {
		std::string_view arg = iter.Next();
		std::size_t pos = arg.find('=');
		if (pos == std::string_view::npos) {
			FAIL("Invalid command-line argument syntax.",
			     log::Attr{"argument", arg});
		}
		std::string_view name = arg.substr(0, pos);
		const VarDefinition *definition = LookupVar(name);
		if (definition == nullptr) {
			FAIL("Command-line contains a value for an unknown variable.",
			     log::Attr{"name", name});
		}
		definition->Set(arg.substr(pos + 1));
	}
	ApplyVars();
}

void ResetVars() {
	for (const VarDefinition &definition : VarDefinitions) {
		definition.Reset();
	}
	log::SetMinimumLevel(log::Level::Debug);
}

} // namespace spin
