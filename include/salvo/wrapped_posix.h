#ifndef SALVO_WRAPPED_POSIX_H
#define SALVO_WRAPPED_POSIX_H

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace Salvo {

class PosixException : public std::runtime_error {
	public:
	PosixException(const std::string m, int err = errno)
		: std::runtime_error{m + ": " + strerror(err)} {}
};

class FileDescriptor {
	public:
	int fd;
	FileDescriptor(int fildes, const std::string& path) : fd{fildes} {
		if (fd < 0) {
			throw PosixException{"Unable to open " + path};
		}
	}
	constexpr operator int() const { return fd; }
	FileDescriptor(const FileDescriptor&) = delete;
	FileDescriptor(FileDescriptor&&) = delete;
	FileDescriptor& operator=(const FileDescriptor&) = delete;
	FileDescriptor& operator=(FileDescriptor&&) = delete;
	~FileDescriptor() { close(fd); }
};

inline int open_for_writing(const std::string& path) {
	return open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

inline int open_for_reading(const std::string& path) {
	return open(path.c_str(), O_RDONLY | O_CLOEXEC);
}

/* writes all of data, retrying on short writes */
inline void write_all(int fd, const std::string& data) {
	size_t written{};
	while (written < data.length()) {
		auto n{write(fd, data.data() + written, data.length() - written)};
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			throw PosixException{"Could not write"};
		}
		written += n;
	}
}

/* like mkdir -p */
inline void make_directories(const std::string& path) {
	for (size_t pos = path.find('/', 1);; pos = path.find('/', pos + 1)) {
		auto dir{path.substr(0, pos)};
		if (!dir.empty() && (mkdir(dir.c_str(), 0755) < 0) && (errno != EEXIST)) {
			throw PosixException{"Could not create directory " + dir};
		}
		if (pos == std::string::npos) {
			break;
		}
	}
}

/* Creates base, or base_2, base_3, ... if it exists already, and returns the
 * name that was created. Parents must exist. */
inline std::string make_unique_directory(const std::string& base) {
	for (size_t n = 1;; n++) {
		auto dir{(n == 1) ? base : base + "_" + std::to_string(n)};
		if (mkdir(dir.c_str(), 0755) == 0) {
			return dir;
		}
		if (errno != EEXIST) {
			throw PosixException{"Could not create directory " + dir};
		}
	}
}

} // namespace Salvo

#endif
