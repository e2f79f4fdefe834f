#include <cstdlib>
#include <iostream>
#include <string>

// Third-party libraries
#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

// Project includes
#include "common/configuration.h"
#include "common/errors.h"
#include "job/job_options.h"
#include "job/partition_source.h"
#include "job/shutdown_signal.h"
#include "job/verify_job.h"
#include "peer/peer_resolver.h"
#include "scan/grpc_row_scanner.h"

namespace {

// Loads the optional YAML file on top of defaults and environment
void LoadConfiguration(const std::string& config_file) {
	VerifyRep::Configuration& configuration = VerifyRep::Configuration::getInstance();
	bool valid = config_file.empty() ? configuration.validate() : configuration.loadFromFile(config_file);
	if (!valid) {
		throw VerifyRep::ConfigurationError(absl::StrCat("Invalid configuration ", config_file, ": ",
					absl::StrJoin(configuration.getValidationErrors(), "; ")));
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	VerifyRep::CommandLine command_line;
	try {
		command_line = VerifyRep::ParseCommandLine(argc, argv);
	} catch (const VerifyRep::InvalidArguments& e) {
		VerifyRep::PrintUsage(std::string("Can't start because ") + e.what());
		return EXIT_FAILURE;
	}
	if (command_line.help) {
		VerifyRep::PrintUsage("");
		return EXIT_FAILURE;
	}
	FLAGS_v = command_line.log_level;

	try {
		LoadConfiguration(command_line.config_file);
		VerifyRep::VerifyJobOptions options =
			VerifyRep::VerifyJobOptions::Create(command_line, VerifyRep::Configuration::getInstance());

		VerifyRep::GrpcPeerRegistry registry(options.registry_address,
				options.registry_connect_timeout, options.registry_rpc_timeout);

		VerifyRep::ScanRpcOptions scan_options;
		scan_options.connect_timeout = options.scan_connect_timeout;
		scan_options.rpc_timeout = options.scan_rpc_timeout;
		VerifyRep::GrpcPartitionSource partition_source(options.local_scan_address, scan_options);
		VerifyRep::GrpcRemoteSessionFactory session_factory(scan_options);

		VerifyRep::VerifyJob job(options, registry, partition_source, session_factory);
		LOG(INFO) << "Starting " << job.name();
		VerifyRep::JobReport report;
		{
			// SIGINT/SIGTERM stop workers between rows so every scanner gets closed
			VerifyRep::ShutdownSignalWatcher shutdown([&job](int) { job.Cancel(); });
			report = job.Run();
		}

		std::cout << VerifyRep::CounterName(VerifyRep::Counter::GOODROWS) << "=" << report.good_rows << std::endl;
		std::cout << VerifyRep::CounterName(VerifyRep::Counter::BADROWS) << "=" << report.bad_rows << std::endl;
		if (report.cancelled) {
			LOG(ERROR) << report.job_name << " was cancelled";
			return EXIT_FAILURE;
		}
		if (!report.Succeeded()) {
			LOG(ERROR) << report.job_name << " did not complete: " << report.failed_partitions
				<< " of " << report.partitions << " partitions failed";
			return EXIT_FAILURE;
		}
	} catch (const VerifyRep::InvalidArguments& e) {
		VerifyRep::PrintUsage(std::string("Can't start because ") + e.what());
		return EXIT_FAILURE;
	} catch (const VerifyRep::VerifyError& e) {
		LOG(ERROR) << "Verification job could not run: " << e.what();
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
