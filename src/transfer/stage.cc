#include "stage.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace Skyvault {

namespace {

// dup2() onto itself leaves FD_CLOEXEC set, so an fd already in place only
// needs the flag cleared to survive execv().
bool RedirectTo(int fd, int target) {
	if (fd < 0) {
		return true;
	}
	if (fd == target) {
		return ::fcntl(fd, F_SETFD, 0) == 0;
	}
	return ::dup2(fd, target) >= 0;
}

} // namespace

std::string CommandSpec::ToString() const {
	std::ostringstream oss;
	oss << program;
	for (const auto& arg : args) {
		oss << ' ' << arg;
	}
	return oss.str();
}

std::optional<fs::path> FindExecutable(const std::string& program) {
	if (program.empty()) {
		return std::nullopt;
	}
	if (program.find('/') != std::string::npos) {
		if (::access(program.c_str(), X_OK) == 0 && !fs::is_directory(program)) {
			return fs::path(program);
		}
		return std::nullopt;
	}

	const char* path_env = std::getenv("PATH");
	std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
	std::stringstream ss(search);
	std::string dir;
	while (std::getline(ss, dir, ':')) {
		if (dir.empty()) {
			dir = ".";
		}
		fs::path candidate = fs::path(dir) / program;
		std::error_code ec;
		if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
			return candidate;
		}
	}
	return std::nullopt;
}

Stage Stage::Spawn(const CommandSpec& spec, int stdin_fd, int stdout_fd, int stderr_fd) {
	// Everything the child needs is built before fork(); the child only
	// calls async-signal-safe functions.
	std::vector<std::string> argv_storage;
	argv_storage.reserve(spec.args.size() + 1);
	argv_storage.push_back(spec.program);
	argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());

	std::vector<char*> argv;
	argv.reserve(argv_storage.size() + 1);
	for (auto& arg : argv_storage) {
		argv.push_back(arg.data());
	}
	argv.push_back(nullptr);

	pid_t pid = ::fork();
	if (pid < 0) {
		throw std::system_error(errno, std::generic_category(), "fork failed for " + spec.label);
	}

	if (pid == 0) {
		if (!RedirectTo(stdin_fd, STDIN_FILENO)) _exit(126);
		if (!RedirectTo(stdout_fd, STDOUT_FILENO)) _exit(126);
		if (!RedirectTo(stderr_fd, STDERR_FILENO)) _exit(126);
		::execv(argv[0], argv.data());
		_exit(127);
	}

	return Stage(pid, spec.label);
}

Stage::~Stage() {
	if (Running()) {
		Terminate();
		Wait();
	}
}

Stage::Stage(Stage&& other) noexcept
	: pid_(other.pid_), label_(std::move(other.label_)), status_(other.status_) {
	other.pid_ = -1;
	other.status_.reset();
}

Stage& Stage::operator=(Stage&& other) noexcept {
	if (this != &other) {
		if (Running()) {
			Terminate();
			Wait();
		}
		pid_ = other.pid_;
		label_ = std::move(other.label_);
		status_ = other.status_;
		other.pid_ = -1;
		other.status_.reset();
	}
	return *this;
}

int Stage::Wait(const std::function<bool()>& should_abort) {
	if (status_.has_value()) {
		return *status_;
	}
	if (pid_ <= 0) {
		return -1;
	}

	int raw = 0;
	while (::waitpid(pid_, &raw, 0) < 0) {
		if (errno != EINTR) {
			status_ = -1;
			return *status_;
		}
		if (should_abort && should_abort()) {
			Terminate();
		}
	}

	if (WIFEXITED(raw)) {
		status_ = WEXITSTATUS(raw);
	} else if (WIFSIGNALED(raw)) {
		status_ = 128 + WTERMSIG(raw);
	} else {
		status_ = -1;
	}
	return *status_;
}

void Stage::Terminate() {
	if (Running()) {
		::kill(pid_, SIGTERM);
	}
}

} // namespace Skyvault
