#pragma once

#include <string>

namespace SecureCopy
{
    enum class TransferErrorType
    {
        None,
        UserDeclined,
        // The executable could not be started at all.
        SpawnFailure,
        // The transport ran and exited with a nonzero status.
        TransportFailure,
    };

    std::string toString(TransferErrorType type);

    /**
     * @brief The result of every copy operation. errorMessage is empty on success.
     */
    struct TransferOutcome
    {
        bool success{true};
        std::string errorMessage{};
        TransferErrorType errorType{TransferErrorType::None};

        explicit operator bool() const
        {
            return success;
        }

        static TransferOutcome succeeded()
        {
            return TransferOutcome{};
        }

        static TransferOutcome failed(TransferErrorType type, std::string message)
        {
            return TransferOutcome{.success = false, .errorMessage = std::move(message), .errorType = type};
        }
    };
}
