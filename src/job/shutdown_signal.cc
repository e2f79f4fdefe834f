#include "shutdown_signal.h"

#include <utility>

#include <glog/logging.h>

namespace VerifyRep {

ShutdownSignalWatcher::ShutdownSignalWatcher(std::function<void(int)> on_signal,
		std::initializer_list<int> signals)
	: on_signal_(std::move(on_signal)), signals_(io_context_) {
	for (int signal_number : signals) {
		signals_.add(signal_number);
	}
	Wait();
	thread_ = std::thread([this] { io_context_.run(); });
}

ShutdownSignalWatcher::~ShutdownSignalWatcher() {
	boost::system::error_code ignored;
	signals_.cancel(ignored);
	io_context_.stop();
	if (thread_.joinable()) {
		thread_.join();
	}
}

void ShutdownSignalWatcher::Wait() {
	signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
		if (error) {
			return;
		}
		if (!fired_) {
			fired_ = true;
			LOG(WARNING) << "Received signal " << signal_number << ", cancelling";
			on_signal_(signal_number);
		} else {
			LOG(WARNING) << "Received signal " << signal_number << " while cancelling, ignored";
		}
		Wait();
	});
}

} // namespace VerifyRep
