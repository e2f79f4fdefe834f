#ifndef VERIFYREP_COMMON_ERRORS_H_
#define VERIFYREP_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace VerifyRep {

/**
 * Base of every error the verifier raises on purpose.
 * Row divergence is not an error; it is counted, not thrown.
 */
class VerifyError : public std::runtime_error {
public:
    explicit VerifyError(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed command line or scan parameters. Raised before anything is scheduled.
class InvalidArguments : public VerifyError {
public:
    explicit InvalidArguments(const std::string& what) : VerifyError(what) {}
};

/// Configuration file could not be loaded or refuses to let the job run.
class ConfigurationError : public VerifyError {
public:
    explicit ConfigurationError(const std::string& what) : VerifyError(what) {}
};

/// The registry has no replication peer with the requested id.
class PeerNotFound : public VerifyError {
public:
    explicit PeerNotFound(const std::string& peer_id)
        : VerifyError("Couldn't get peer conf for peer " + peer_id), peer_id_(peer_id) {}

    const std::string& peer_id() const { return peer_id_; }

private:
    std::string peer_id_;
};

/// The registry could not be reached or returned unusable data.
class MetadataUnavailable : public VerifyError {
public:
    explicit MetadataUnavailable(const std::string& what) : VerifyError(what) {}
};

/// A scan cursor (local or remote) failed: RPC error, lease expiry, bad reply.
class ScanError : public VerifyError {
public:
    explicit ScanError(const std::string& what) : VerifyError(what) {}
};

/// Opening or reading the remote cursor of a partition failed. Fatal to the partition.
class RemoteSessionError : public VerifyError {
public:
    explicit RemoteSessionError(const std::string& what) : VerifyError(what) {}
};

/// The job was cancelled while a partition was still running.
class JobCancelled : public VerifyError {
public:
    JobCancelled() : VerifyError("verification job cancelled") {}
};

} // namespace VerifyRep

#endif // VERIFYREP_COMMON_ERRORS_H_
