// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_file.hpp"

#include "log.hpp"
#include "os_string.hpp"
#include "var.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spin {

namespace {

// Shader sources are small. Anything larger is probably the wrong file.
constexpr std::size_t MaxFileSize = 1024 * 1024;

// The strerror_r function returns int in POSIX and char * in glibc.
[[maybe_unused]] const char *ErrorText(int result, const char *buffer) {
	return result == 0 ? buffer : "";
}
[[maybe_unused]] const char *ErrorText(const char *result, const char *) {
	return result;
}

// The current errno value, as log attributes.
class ErrnoInfo {
public:
	ErrnoInfo() : mError{errno} {
		char buffer[256];
		buffer[0] = '\0';
		mText = ErrorText(strerror_r(mError, buffer, sizeof(buffer)), buffer);
	}

	void AddToRecord(log::Record &record) const {
		record.Add("errno", mError);
		if (!mText.empty()) {
			record.Add("description", mText);
		}
	}

private:
	int mError;
	std::string mText;
};

// Closes a file descriptor when it goes out of scope.
class FileCloser {
public:
	explicit FileCloser(int fd) : mFile{fd} {}
	FileCloser(const FileCloser &) = delete;
	FileCloser &operator=(const FileCloser &) = delete;
	~FileCloser() { ::close(mFile); }

private:
	int mFile;
};

} // namespace

bool ReadFile(std::vector<unsigned char> *data, std::string_view fileName) {
	if (var::ProjectPath.get().empty()) {
		FAIL("Project path is not set.");
	}
	std::string path{var::ProjectPath.get()};
	AppendPath(&path, fileName);
	const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd == -1) {
		LOG(Error, "Could not open file.", log::Attr{"file", path},
		    ErrnoInfo{});
		return false;
	}
	FileCloser closer{fd};
	struct stat st;
	if (::fstat(fd, &st) != 0) {
		LOG(Error, "Could not get file information.", log::Attr{"file", path},
		    ErrnoInfo{});
		return false;
	}
	const off_t osize = st.st_size;
	if (osize > static_cast<off_t>(MaxFileSize)) {
		LOG(Error, "File is too large.", log::Attr{"file", path},
		    log::Attr{"size", static_cast<long long>(osize)},
		    log::Attr{"maxSize", MaxFileSize});
		return false;
	}
	const std::size_t size = static_cast<std::size_t>(osize);
	data->resize(size);
	for (std::size_t pos = 0; pos < size;) {
		ssize_t amt = ::read(fd, data->data() + pos, size - pos);
		if (amt < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(Error, "Could not read file.", log::Attr{"file", path},
			    ErrnoInfo{});
			return false;
		}
		if (amt == 0) {
			LOG(Error, "File changed while reading.", log::Attr{"file", path});
			return false;
		}
		pos += amt;
	}
	return true;
}

} // namespace spin
