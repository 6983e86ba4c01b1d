#include "transfer_pipeline.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>

#include "common/errors.h"
#include "common/interrupt.h"
#include "lineage/naming.h"

namespace Skyvault {

namespace {

constexpr size_t kProgressReadBytes = 4096;

fs::path ResolveTool(const std::string& program, const char* role) {
	auto resolved = FindExecutable(program);
	if (!resolved) {
		throw PreconditionFailure(std::string(role) + " '" + program + "' must be in PATH");
	}
	return *resolved;
}

} // namespace

// ---------------------------------------------------------------------------
// PreparedTransfer
// ---------------------------------------------------------------------------

PreparedTransfer::PreparedTransfer(fs::path target, std::vector<Stage> stages, ScopedFd progress_fd,
                                   EventSink& sink)
	: target_(std::move(target)),
	  stages_(std::move(stages)),
	  progress_fd_(std::move(progress_fd)),
	  sink_(sink) {}

bool PreparedTransfer::NextProgress(std::string* line) {
	if (finished_) {
		Rethrow();
		return false;
	}
	if (progress_fd_.valid()) {
		if (ReadLine(line)) {
			return true;
		}
		progress_fd_.Reset();
	}
	Collect();
	Rethrow();
	return false;
}

void PreparedTransfer::Wait() {
	std::string discarded;
	while (NextProgress(&discarded)) {
		sink_.Verbose(target_.filename().string() + ": " + discarded);
	}
}

void PreparedTransfer::Abort() {
	for (auto& stage : stages_) {
		stage.Terminate();
	}
}

// Lines from the meter are terminated by '\r' (in-place refresh) or '\n'.
bool PreparedTransfer::ReadLine(std::string* line) {
	for (;;) {
		// The signal may have landed while the caller was handling a previous line.
		if (InterruptRequested()) {
			sink_.Warning("Interrupted, terminating stages writing " + target_.string());
			Abort();
			return false;
		}
		size_t end = pending_.find_first_of("\r\n");
		while (end == 0) {
			pending_.erase(0, 1);
			end = pending_.find_first_of("\r\n");
		}
		if (end != std::string::npos) {
			*line = pending_.substr(0, end);
			pending_.erase(0, end + 1);
			return true;
		}

		char buf[kProgressReadBytes];
		ssize_t n = ::read(progress_fd_.get(), buf, sizeof(buf));
		if (n > 0) {
			pending_.append(buf, static_cast<size_t>(n));
			continue;
		}
		if (n == 0) {
			if (pending_.empty()) {
				return false;
			}
			*line = std::move(pending_);
			pending_.clear();
			return true;
		}
		if (errno == EINTR) {
			continue;
		}
		sink_.Error(std::string("Failed to read progress: ") + strerror(errno));
		return false;
	}
}

void PreparedTransfer::Collect() {
	std::vector<std::string> failed;
	for (auto& stage : stages_) {
		int status = stage.Wait([]() { return InterruptRequested(); });
		if (status != 0) {
			std::ostringstream oss;
			oss << stage.label() << " exited with status " << status;
			failed.push_back(oss.str());
		}
	}
	finished_ = true;

	if (InterruptRequested()) {
		cancelled_ = true;
		return;
	}
	if (!failed.empty()) {
		std::ostringstream oss;
		oss << "Preparing " << target_.string() << " failed:";
		for (const auto& f : failed) {
			oss << ' ' << f << ';';
		}
		oss << " the file is left in place and is not a valid artifact";
		failure_ = oss.str();
		sink_.Error(*failure_);
		return;
	}
	sink_.Verbose("Prepared " + target_.string());
}

void PreparedTransfer::Rethrow() const {
	if (cancelled_) {
		throw OperationCancelled("Preparation of " + target_.string() + " was interrupted");
	}
	if (failure_) {
		throw PipelineFailure(*failure_);
	}
}

// ---------------------------------------------------------------------------
// TransferPipeline
// ---------------------------------------------------------------------------

TransferPipeline::TransferPipeline(TransferOptions options, EventSink& sink)
	: options_(std::move(options)), sink_(sink) {}

std::unique_ptr<PreparedTransfer> TransferPipeline::Prepare(const ArchivalUnit& unit,
                                                            const fs::path& destination_dir,
                                                            const std::optional<std::string>& crypto_recipient) {
	const std::string name = StorageName(unit);
	const fs::path dir = fs::absolute(destination_dir);

	std::error_code ec;
	if (!fs::is_directory(dir, ec)) {
		throw PreconditionFailure(dir.string() + " does not exist.");
	}
	const fs::path target = dir / name;
	if (fs::exists(fs::symlink_status(target, ec))) {
		throw PreconditionFailure(target.string() + " already exists.");
	}

	const bool encrypt = crypto_recipient.has_value() && !crypto_recipient->empty();

	ToolSet resolved = options_.tools;
	resolved.serializer = ResolveTool(options_.tools.serializer, "Serializer").string();
	if (encrypt) {
		resolved.encryptor = ResolveTool(options_.tools.encryptor, "Encryptor").string();
	}
	bool meter = false;
	if (options_.metering) {
		if (auto found = FindExecutable(options_.tools.meter)) {
			resolved.meter = found->string();
			meter = true;
		} else {
			sink_.Warning("Meter '" + options_.tools.meter + "' not found, no progress will be reported");
		}
	}

	std::vector<CommandSpec> specs = StageChainBuilder(resolved, unit)
		.WithEncryption(encrypt, encrypt ? *crypto_recipient : std::string())
		.WithMetering(meter, options_.rate_limit)
		.Build();

	ScopedFd target_fd(::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
	if (!target_fd.valid()) {
		throw PreconditionFailure("Cannot create " + target.string() + ": " + strerror(errno));
	}

	sink_.Info("Preparing " + Describe(unit) + " into " + target.string());

	ScopedFd stdin_null = OpenDevNull(O_RDONLY);
	ScopedFd stderr_null = OpenDevNull(O_WRONLY);
	ScopedFd progress_read;
	ScopedFd upstream;  // read end of the previous stage's output
	std::vector<Stage> stages;
	stages.reserve(specs.size());

	for (size_t i = 0; i < specs.size(); ++i) {
		const CommandSpec& spec = specs[i];
		const bool last = i + 1 == specs.size();

		PipeEnds downstream;
		if (!last) {
			downstream = MakePipe();
		}
		ScopedFd progress_write;
		int stderr_fd = -1;
		if (spec.label == kSerializerLabel) {
			stderr_fd = stderr_null.get();
		} else if (spec.label == kMeterLabel) {
			PipeEnds progress = MakePipe();
			progress_read = std::move(progress.read);
			progress_write = std::move(progress.write);
			stderr_fd = progress_write.get();
		}

		const int stdin_fd = i == 0 ? stdin_null.get() : upstream.get();
		const int stdout_fd = last ? target_fd.get() : downstream.write.get();
		stages.push_back(Stage::Spawn(spec, stdin_fd, stdout_fd, stderr_fd));
		sink_.Verbose("Started " + spec.label + ": " + spec.ToString());

		// The children hold their own copies now.
		upstream = std::move(downstream.read);
	}

	return std::make_unique<PreparedTransfer>(target, std::move(stages), std::move(progress_read), sink_);
}

} // namespace Skyvault
