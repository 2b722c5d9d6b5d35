
#include "unhide_output.hxx"
#include "include/utils.hxx"
#include <fcntl.h>
#include <unistd.h>

int x_unhide_output_append(const std::string &path, const std::string &line)
{
	std::string buf = line;
	buf += '\n';

	int fd = open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
	if (fd < 0) {
		int err = -errno;
		X_LOG(OUTPUT, ERR, "open %s, errno=%d", path.c_str(), -err);
		return err;
	}

	int err = 0;
	ssize_t ret;
	do {
		ret = write(fd, buf.data(), buf.size());
	} while (ret < 0 && errno == EINTR);

	if (ret < 0) {
		err = -errno;
		X_LOG(OUTPUT, ERR, "write %s, errno=%d", path.c_str(), -err);
	} else if (size_t(ret) != buf.size()) {
		err = -EIO;
		X_LOG(OUTPUT, ERR, "short write %s, %zd of %zu",
				path.c_str(), ret, buf.size());
	}

	if (close(fd) != 0 && err == 0) {
		err = -errno;
		X_LOG(OUTPUT, ERR, "close %s, errno=%d", path.c_str(), -err);
	}
	return err;
}

