#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "archive_session.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "common/event_sink.h"
#include "common/interrupt.h"
#include "remote/local_directory_store.h"
#include "snapshot_inspector.h"
#include "transfer/transfer_pipeline.h"

namespace {

constexpr int kExitRuntimeFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

// Command-line flags take precedence over the file, the file over the defaults.
void ApplyArguments(const cxxopts::ParseResult& arguments, Skyvault::SkyvaultConfig& config) {
	if (arguments.count("lineage")) config.lineage.manifest.set(arguments["lineage"].as<std::string>());
	if (arguments.count("container")) config.store.container.set(arguments["container"].as<std::string>());
	if (arguments.count("store-root")) config.store.root.set(arguments["store-root"].as<std::string>());
	if (arguments.count("segment-bytes")) config.store.segment_bytes.set(arguments["segment-bytes"].as<size_t>());
	if (arguments.count("dest")) config.transfer.destination_dir.set(arguments["dest"].as<std::string>());
	if (arguments.count("recipient")) config.transfer.crypto_recipient.set(arguments["recipient"].as<std::string>());
	if (arguments.count("rate-limit")) config.transfer.rate_limit.set(arguments["rate-limit"].as<std::string>());
	if (arguments.count("no-meter")) config.transfer.metering.set(false);
	if (arguments.count("keep-artifacts")) config.transfer.keep_artifacts.set(true);
	if (arguments.count("dry-run")) config.run.dry_run.set(true);
	if (arguments.count("verbose")) config.run.verbosity.set(arguments["verbose"].as<int>());
}

int Run(const Skyvault::SkyvaultConfig& config) {
	Skyvault::GlogEventSink sink;

	Skyvault::ManifestSnapshotInspector inspector(config.lineage.manifest.get());
	std::vector<Skyvault::Snapshot> lineage = inspector.FindSnapshots();

	Skyvault::TransferOptions transfer_options;
	transfer_options.tools.serializer = config.tools.serializer.get();
	transfer_options.tools.encryptor = config.tools.encryptor.get();
	transfer_options.tools.meter = config.tools.meter.get();
	transfer_options.metering = config.transfer.metering.get();
	transfer_options.rate_limit = config.transfer.rate_limit.get();
	Skyvault::TransferPipeline pipeline(transfer_options, sink);

	Skyvault::LocalDirectoryStore store(config.store.root.get(), config.store.segment_bytes.get());

	Skyvault::SessionOptions session_options;
	session_options.container = config.store.container.get();
	session_options.destination_dir = config.transfer.destination_dir.get();
	if (!config.transfer.crypto_recipient.get().empty()) {
		session_options.crypto_recipient = config.transfer.crypto_recipient.get();
	}
	session_options.keep_artifacts = config.transfer.keep_artifacts.get();
	session_options.dry_run = config.run.dry_run.get();

	Skyvault::ArchiveSession session(session_options, pipeline, store, sink);
	Skyvault::SessionReport report = session.Run(lineage);

	LOG(INFO) << report.snapshots << " snapshot(s), " << report.already_archived << " already archived, "
	          << report.units_archived << " archived now";
	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("skyvault", "Incrementally archive read-only snapshots to an object store");
	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("lineage", "Lineage manifest listing the read-only snapshots", cxxopts::value<std::string>())
		("container", "Container name of the object store", cxxopts::value<std::string>())
		("store-root", "Root directory of the object store", cxxopts::value<std::string>())
		("segment-bytes", "Upload segment size in bytes", cxxopts::value<size_t>())
		("d,dest", "Directory where artifacts are prepared", cxxopts::value<std::string>())
		("r,recipient", "Encrypt artifacts for this age recipient", cxxopts::value<std::string>())
		("rate-limit", "Transfer rate cap passed to the meter (100, 1K, 1M...)", cxxopts::value<std::string>())
		("no-meter", "Do not report preparation progress")
		("keep-artifacts", "Keep local artifacts after upload")
		("n,dry-run", "Only report what would be archived")
		("v,verbose", "Verbose log level", cxxopts::value<int>()->implicit_value("1"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed = options.parse(argc, argv);
	} catch (const std::exception& e) {
		std::cerr << e.what() << "\n" << options.help() << std::endl;
		return kExitUsage;
	}
	const cxxopts::ParseResult& arguments = *parsed;
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	Skyvault::Configuration& configuration = Skyvault::Configuration::getInstance();
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return kExitUsage;
	}
	ApplyArguments(arguments, configuration.config());
	FLAGS_v = configuration.config().run.verbosity.get();

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return kExitUsage;
	}
	if (configuration.config().lineage.manifest.get().empty() || configuration.getContainer().empty()) {
		LOG(ERROR) << "--lineage and --container are required";
		std::cerr << options.help() << std::endl;
		return kExitUsage;
	}

	Skyvault::InstallInterruptHandlers();

	try {
		return Run(configuration.config());
	} catch (const Skyvault::OperationCancelled& e) {
		LOG(WARNING) << e.what();
		return kExitInterrupted;
	} catch (const Skyvault::InconsistentLayout& e) {
		LOG(ERROR) << "Archive and local snapshots have diverged, manual reconciliation needed: " << e.what();
		return kExitUsage;
	} catch (const Skyvault::DuplicateOrNullInput& e) {
		LOG(ERROR) << e.what();
		return kExitUsage;
	} catch (const Skyvault::ConfigurationError& e) {
		LOG(ERROR) << e.what();
		return kExitUsage;
	} catch (const Skyvault::SkyvaultError& e) {
		LOG(ERROR) << e.what();
		return kExitRuntimeFailure;
	} catch (const std::system_error& e) {
		LOG(ERROR) << "System error: " << e.what();
		return kExitRuntimeFailure;
	}
}
