#ifndef SKYVAULT_TRANSFER_TRANSFER_PIPELINE_H_
#define SKYVAULT_TRANSFER_TRANSFER_PIPELINE_H_

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/event_sink.h"
#include "common/scoped_fd.h"
#include "lineage/snapshot.h"
#include "stage.h"
#include "stage_chain.h"

namespace Skyvault {

namespace fs = std::filesystem;

struct TransferOptions {
	ToolSet tools;
	// Metering is skipped with a warning when the meter cannot be found.
	bool metering = true;
	std::string rate_limit;
};

/**
 * A running stage chain writing one artifact.
 *
 * Progress is pull-driven: every NextProgress() call blocks on the meter's
 * output until a line is available. Once the output is exhausted, every stage
 * is reaped and a non-zero status raises PipelineFailure. Without a meter the
 * first call goes straight to reaping.
 *
 * The artifact is complete only after Wait() (or NextProgress() returning
 * false) has returned normally. On failure it is left in place and must not
 * be used.
 */
class PreparedTransfer {
public:
	PreparedTransfer(fs::path target, std::vector<Stage> stages, ScopedFd progress_fd, EventSink& sink);
	~PreparedTransfer() = default;

	PreparedTransfer(const PreparedTransfer&) = delete;
	PreparedTransfer& operator=(const PreparedTransfer&) = delete;

	const fs::path& TargetPath() const { return target_; }

	/**
	 * @return false once the pipeline has completed successfully
	 * @throws PipelineFailure if a stage exited non-zero
	 * @throws OperationCancelled if an interrupt arrived while blocked or since the last call
	 */
	bool NextProgress(std::string* line);

	// Drains the remaining progress and reaps every stage. Idempotent.
	void Wait();

	// Terminates every live stage. The next NextProgress()/Wait() reports the outcome.
	void Abort();

	bool Finished() const { return finished_; }
	size_t StageCount() const { return stages_.size(); }

	class Iterator {
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = std::string;
		using difference_type = std::ptrdiff_t;
		using pointer = const std::string*;
		using reference = const std::string&;

		Iterator() = default;
		explicit Iterator(PreparedTransfer* transfer) : transfer_(transfer) { Advance(); }

		reference operator*() const { return line_; }
		pointer operator->() const { return &line_; }
		Iterator& operator++() {
			Advance();
			return *this;
		}
		bool operator==(const Iterator& other) const { return transfer_ == other.transfer_; }
		bool operator!=(const Iterator& other) const { return !(*this == other); }

	private:
		void Advance() {
			if (transfer_ && !transfer_->NextProgress(&line_)) {
				transfer_ = nullptr;
			}
		}

		PreparedTransfer* transfer_ = nullptr;
		std::string line_;
	};

	// Single pass over the progress lines; reaching end() means success.
	Iterator begin() { return Iterator(this); }
	Iterator end() { return Iterator(); }

private:
	bool ReadLine(std::string* line);
	void Collect();
	void Rethrow() const;

	fs::path target_;
	std::vector<Stage> stages_;
	ScopedFd progress_fd_;
	std::string pending_;
	EventSink& sink_;

	bool finished_ = false;
	bool cancelled_ = false;
	std::optional<std::string> failure_;
};

/**
 * Turns an archival unit into a local artifact through a chain of external
 * tools (serializer, optional encryptor, optional meter).
 */
class TransferPipeline {
public:
	TransferPipeline(TransferOptions options, EventSink& sink);

	/**
	 * Checks every precondition, creates <destination_dir>/<StorageName(unit)>
	 * exclusively and starts the stages. Returns as soon as they run.
	 *
	 * @param crypto_recipient adds the encryption stage when set and non-empty
	 * @throws PreconditionFailure if destination_dir is missing, the target
	 *         exists, or a required tool is not found; no stage is spawned
	 * @throws InvalidNameError if the unit cannot be named
	 */
	std::unique_ptr<PreparedTransfer> Prepare(const ArchivalUnit& unit,
	                                          const fs::path& destination_dir,
	                                          const std::optional<std::string>& crypto_recipient);

	const TransferOptions& options() const { return options_; }

private:
	TransferOptions options_;
	EventSink& sink_;
};

} // namespace Skyvault

#endif // SKYVAULT_TRANSFER_TRANSFER_PIPELINE_H_
