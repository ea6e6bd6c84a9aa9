#ifndef GRAFT_COMMON_ERROR_HPP
#define GRAFT_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace Graft {
    // Root of every failure the training run reports on purpose. Anything else
    // escaping the driver (std::bad_alloc, c10::Error from a kernel) is a bug or
    // an environment problem and is surfaced as-is.
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Unknown optimizer, indivisible batch size, invalid schedule parameters...
    // Raised while initializing, before any training work starts.
    class ConfigurationError : public Error {
    public:
        using Error::Error;
    };

    // Checkpoint missing, unreadable, or incompatible with the freshly built model.
    class CheckpointLoadError : public Error {
    public:
        using Error::Error;
    };

    // Propagated verbatim from the dataset collaborator.
    class DatasetError : public Error {
    public:
        using Error::Error;
    };

    // A participant failed or hung during collective synchronization. Not
    // recoverable locally: the whole run has to terminate.
    class DistributedCoordinationFailure : public Error {
    public:
        using Error::Error;
    };
}

#endif // GRAFT_COMMON_ERROR_HPP
