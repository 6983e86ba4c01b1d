#ifndef SKYVAULT_TRANSFER_STAGE_H_
#define SKYVAULT_TRANSFER_STAGE_H_

#include <sys/types.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Skyvault {

namespace fs = std::filesystem;

/**
 * One external byte-transform command: what to run, not how it is wired.
 * program is a bare name or a path until the pipeline resolves it.
 */
struct CommandSpec {
	std::string label;
	std::string program;
	std::vector<std::string> args;

	std::string ToString() const;
};

/**
 * Locates program the way a shell would: through PATH for bare names, by
 * checking execute permission for anything containing '/'.
 */
std::optional<fs::path> FindExecutable(const std::string& program);

/**
 * A spawned byte-transform process.
 *
 * Stdio ends are passed as raw descriptors owned by the caller; the child
 * gets copies and the caller closes its own ends once every stage is spawned.
 * A stage that is destroyed before being waited is terminated and reaped, so
 * it never outlives its owner.
 */
class Stage {
public:
	/**
	 * Forks and execs spec.program (must be resolved already).
	 * @param stdin_fd  fd to read from, -1 to inherit
	 * @param stdout_fd fd to write to, -1 to inherit
	 * @param stderr_fd fd for diagnostics, -1 to inherit
	 * @throws std::system_error if fork fails
	 */
	static Stage Spawn(const CommandSpec& spec, int stdin_fd, int stdout_fd, int stderr_fd);

	~Stage();

	Stage(const Stage&) = delete;
	Stage& operator=(const Stage&) = delete;
	Stage(Stage&& other) noexcept;
	Stage& operator=(Stage&& other) noexcept;

	/**
	 * Blocks until the process exits and returns its status: the exit code,
	 * or 128 + signal number when it was killed. Cached after the first call.
	 * @param should_abort polled when the wait is interrupted by a signal;
	 *        returning true terminates the process before waiting again
	 */
	int Wait(const std::function<bool()>& should_abort = nullptr);

	// Sends SIGTERM if the process is still running.
	void Terminate();

	bool Running() const { return pid_ > 0 && !status_.has_value(); }
	pid_t pid() const { return pid_; }
	const std::string& label() const { return label_; }

private:
	Stage(pid_t pid, std::string label) : pid_(pid), label_(std::move(label)) {}

	pid_t pid_ = -1;
	std::string label_;
	std::optional<int> status_;
};

} // namespace Skyvault

#endif // SKYVAULT_TRANSFER_STAGE_H_
