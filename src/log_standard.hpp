// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// Record and attribute types for structured logging.

#include <concepts>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace spin {
namespace log {

// Log message severity level, from least to most severe.
enum class Level {
	Debug,
	Info,
	Warn,
	Error,
};

// Parse a lower-case level name, such as "info" or "warn".
std::optional<Level> ParseLevel(std::string_view name);

// The kinds of value that an attribute can hold.
enum class Kind {
	Int,
	Uint,
	Float,
	Bool,
	String,
};

// An attribute value. Strings are not copied, so the value must not outlive
// the string it refers to.
class Value {
public:
	constexpr Value(bool value) : mKind{Kind::Bool}, mBool{value} {}
	template <std::signed_integral T>
	constexpr Value(T value) : mKind{Kind::Int}, mInt{value} {}
	template <std::unsigned_integral T>
		requires(!std::same_as<T, bool>)
	constexpr Value(T value) : mKind{Kind::Uint}, mUint{value} {}
	template <std::floating_point T>
	constexpr Value(T value) : mKind{Kind::Float}, mFloat{value} {}
	constexpr Value(const char *value)
		: mKind{Kind::String}, mString{value} {}
	constexpr Value(std::string_view value)
		: mKind{Kind::String}, mString{value} {}
	template <typename T>
		requires(std::convertible_to<const T &, std::string_view> &&
	             !std::convertible_to<const T &, const char *>)
	constexpr Value(const T &value)
		: mKind{Kind::String}, mString{std::string_view{value}} {}

	Kind ValueKind() const { return mKind; }
	long long IntValue() const { return mKind == Kind::Int ? mInt : 0; }
	unsigned long long UintValue() const {
		return mKind == Kind::Uint ? mUint : 0;
	}
	double FloatValue() const { return mKind == Kind::Float ? mFloat : 0.0; }
	bool BoolValue() const { return mKind == Kind::Bool && mBool; }
	std::string_view StringValue() const {
		return mKind == Kind::String ? mString : std::string_view{};
	}

private:
	Kind mKind;
	union {
		bool mBool;
		long long mInt;
		unsigned long long mUint;
		double mFloat;
		std::string_view mString;
	};
};

class Record;

// Anything that can add attributes to a record: an Attr, or an error object
// that knows how to describe itself, like the GLFW error information.
template <typename T>
concept AttributeProvider = requires(const T &t, Record &r) {
	{ t.AddToRecord(r) };
};

// A named value attached to a log record.
class Attr {
public:
	constexpr Attr(std::string_view name, Value value)
		: mName{name}, mValue{value} {}

	std::string_view name() const { return mName; }
	const Value &value() const { return mValue; }

	inline void AddToRecord(Record &record) const;

private:
	std::string_view mName;
	Value mValue;
};

// Initialize logging. Until this is called, Log() writes nothing.
void Init();

// Drop records below the given level.
void SetMinimumLevel(Level level);

// Source location of a log statement. Records from callbacks have no location.
struct Location {
	std::string_view file;
	int line;
	std::string_view function;

	static const Location Zero;

	bool is_empty() const { return file.empty(); }
};

// A single log message with its attributes.
class Record {
public:
	Record(Level level, Location location, std::string_view message,
	       const AttributeProvider auto &...attrs)
		: mLevel{level}, mLocation{location}, mMessage{message} {
		// Providers are taken by reference, since some of them own the strings
		// they add.
		((void)attrs.AddToRecord(*this), ...);
	}

	static Record CheckFailure(Location location, std::string_view condition) {
		return Record{Level::Error, location, "Check failed.",
		              Attr{"condition", condition}};
	}

	Level level() const { return mLevel; }
	const Location &location() const { return mLocation; }
	std::string_view message() const { return mMessage; }
	std::span<const Attr> attributes() const { return mAttributes; }

	void Add(std::string_view name, Value value) {
		mAttributes.emplace_back(name, value);
	}

	// Write the record, if its level is enabled.
	void Log() const;

	// Write the record and exit with an error status.
	[[noreturn]]
	void Fail() const;

private:
	Level mLevel;
	Location mLocation;
	std::string_view mMessage;
	std::vector<Attr> mAttributes;
};

inline void Attr::AddToRecord(Record &record) const {
	record.Add(mName, mValue);
}

} // namespace log
} // namespace spin

#define LOG_LOCATION \
	::spin::log::Location { \
		__FILE__, __LINE__, __func__ \
	}
