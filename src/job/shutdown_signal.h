#ifndef VERIFYREP_JOB_SHUTDOWN_SIGNAL_H_
#define VERIFYREP_JOB_SHUTDOWN_SIGNAL_H_

#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace VerifyRep {

/**
 * Runs a callback on its own thread the first time one of the given signals
 * arrives. Later signals are absorbed until the watcher is destroyed, so a
 * second Ctrl-C does not kill a job that is closing its scanners.
 */
class ShutdownSignalWatcher {
public:
	explicit ShutdownSignalWatcher(std::function<void(int)> on_signal,
			std::initializer_list<int> signals = {SIGINT, SIGTERM});
	~ShutdownSignalWatcher();

	ShutdownSignalWatcher(const ShutdownSignalWatcher&) = delete;
	ShutdownSignalWatcher& operator=(const ShutdownSignalWatcher&) = delete;

private:
	void Wait();

	std::function<void(int)> on_signal_;
	bool fired_ = false;
	boost::asio::io_context io_context_;
	boost::asio::signal_set signals_;
	std::thread thread_;
};

} // namespace VerifyRep

#endif // VERIFYREP_JOB_SHUTDOWN_SIGNAL_H_
