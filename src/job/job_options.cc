#include "job_options.h"

#include <iostream>

#include <cxxopts.hpp>

#include "absl/strings/str_cat.h"

#include "common/config.h"
#include "common/errors.h"

namespace VerifyRep {

namespace {

cxxopts::Options BuildOptions() {
	cxxopts::Options options(VERIFYREP_NAME, "Compares a local table with its replica on a replication peer");

	options.add_options()
		("h,help", "Print usage")
		("starttime", "Beginning of the time range (epoch ms)", cxxopts::value<int64_t>())
		("endtime", "End of the time range (epoch ms), exclusive", cxxopts::value<int64_t>())
		("versions", "Number of cell versions to verify", cxxopts::value<int>())
		("families", "Comma-separated list of families to verify", cxxopts::value<std::string>())
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("args", "<peerid> <tablename>", cxxopts::value<std::vector<std::string>>());

	options.parse_positional({"args"});
	return options;
}

} // end of namespace

CommandLine ParseCommandLine(int argc, char* argv[]) {
	cxxopts::Options options = BuildOptions();
	CommandLine command_line;
	try {
		auto result = options.parse(argc, argv);

		if (result.count("help")) {
			command_line.help = true;
			return command_line;
		}
		if (result.count("starttime")) {
			command_line.time_range.start = result["starttime"].as<int64_t>();
		}
		if (result.count("endtime")) {
			command_line.time_range.end = result["endtime"].as<int64_t>();
		}
		if (result.count("versions")) {
			command_line.max_versions = result["versions"].as<int>();
		}
		if (result.count("families")) {
			command_line.families = ParseFamilyList(result["families"].as<std::string>());
		}
		if (result.count("config")) {
			command_line.config_file = result["config"].as<std::string>();
		}
		command_line.log_level = result["log_level"].as<int>();

		std::vector<std::string> args;
		if (result.count("args")) {
			args = result["args"].as<std::vector<std::string>>();
		}
		if (args.size() != 2) {
			throw InvalidArguments(absl::StrCat("Expected <peerid> <tablename>, got ", args.size(),
						" positional argument(s)"));
		}
		command_line.peer_id = args[0];
		command_line.table_name = args[1];
	} catch (const VerifyError&) {
		throw;
	} catch (const std::exception& e) {
		// cxxopts parse and conversion errors
		throw InvalidArguments(e.what());
	}

	if (command_line.peer_id.empty() || command_line.table_name.empty()) {
		throw InvalidArguments("Both <peerid> and <tablename> are required");
	}
	return command_line;
}

std::string Usage() {
	return absl::StrCat(
			"Usage: ", VERIFYREP_NAME, " [--starttime=X] [--endtime=Y] [--versions=N] [--families=A]",
			" [--config=FILE] <peerid> <tablename>\n"
			"\n"
			"Options:\n"
			" starttime    beginning of the time range\n"
			"              without endtime means from starttime to forever\n"
			" endtime      end of the time range\n"
			" versions     number of cell versions to verify\n"
			" families     comma-separated list of families to verify\n"
			" config       YAML configuration file\n"
			"\n"
			"Args:\n"
			" peerid       Id of the peer used for verification, must match the one given for replication\n"
			" tablename    Name of the table to verify\n"
			"\n"
			"Examples:\n"
			" To verify the data replicated from TestTable for a 1 hour window with peer #5\n"
			" $ ", VERIFYREP_NAME, " --starttime=1265875194289 --endtime=1265878794289 5 TestTable\n");
}

void PrintUsage(const std::string& error_msg) {
	if (!error_msg.empty()) {
		std::cerr << "ERROR: " << error_msg << std::endl;
	}
	std::cerr << Usage();
}

std::string VerifyJobOptions::JobName() const {
	return absl::StrCat(VERIFYREP_NAME, "_", table_name);
}

VerifyJobOptions VerifyJobOptions::Create(const CommandLine& command_line, const Configuration& configuration) {
	VerifyJobOptions options;
	options.peer_id = command_line.peer_id;
	options.table_name = command_line.table_name;
	options.time_range = command_line.time_range;
	options.max_versions = command_line.max_versions;
	options.families = command_line.families;

	options.scan_caching = configuration.getScanCaching();
	options.worker_threads = configuration.getWorkerThreads();
	options.max_partition_attempts = configuration.getMaxPartitionAttempts();
	options.replication_enabled = configuration.isReplicationEnabled();

	options.registry_address = configuration.getRegistryAddress();
	options.registry_connect_timeout = std::chrono::milliseconds(configuration.getRegistryConnectTimeoutMs());
	options.registry_rpc_timeout = std::chrono::milliseconds(configuration.getRegistryRpcTimeoutMs());
	options.local_scan_address = configuration.getLocalScanAddress();
	options.scan_connect_timeout = std::chrono::milliseconds(configuration.getScanConnectTimeoutMs());
	options.scan_rpc_timeout = std::chrono::milliseconds(configuration.getScanRpcTimeoutMs());
	return options;
}

} // namespace VerifyRep
