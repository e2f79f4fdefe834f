#ifndef VERIFYREP_JOB_JOB_OPTIONS_H_
#define VERIFYREP_JOB_JOB_OPTIONS_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/configuration.h"
#include "scan/scan_spec.h"

namespace VerifyRep {

/// Arguments as given on the command line
struct CommandLine {
	bool help = false;
	std::string peer_id;
	std::string table_name;
	TimeRange time_range;
	std::optional<int> max_versions;
	std::vector<std::string> families;
	std::string config_file;
	int log_level = 1;
};

/**
 * Parses
 *   verifyrep [--starttime=X] [--endtime=Y] [--versions=N] [--families=A,B]
 *             [--config=FILE] [-l LEVEL] <peerid> <tablename>
 * @throws InvalidArguments
 */
CommandLine ParseCommandLine(int argc, char* argv[]);

std::string Usage();

/// Writes "ERROR: <error_msg>" (when not empty) and the usage text to stderr
void PrintUsage(const std::string& error_msg);

/**
 * Everything a job needs, fixed at submission and passed explicitly to every
 * component. Never mutated afterwards.
 */
struct VerifyJobOptions {
	std::string peer_id;
	std::string table_name;
	TimeRange time_range;
	std::optional<int> max_versions;
	std::vector<std::string> families;

	int scan_caching = 1;
	int worker_threads = 1;
	int max_partition_attempts = 1;
	bool replication_enabled = true;

	std::string registry_address;
	std::chrono::milliseconds registry_connect_timeout{2000};
	std::chrono::milliseconds registry_rpc_timeout{5000};
	std::string local_scan_address;
	std::chrono::milliseconds scan_connect_timeout{2000};
	std::chrono::milliseconds scan_rpc_timeout{60000};

	/// verifyrep_<table>
	std::string JobName() const;

	static VerifyJobOptions Create(const CommandLine& command_line, const Configuration& configuration);
};

} // namespace VerifyRep

#endif // VERIFYREP_JOB_JOB_OPTIONS_H_
