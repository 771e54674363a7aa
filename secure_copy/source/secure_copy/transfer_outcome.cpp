#include <secure_copy/transfer_outcome.hpp>

namespace SecureCopy
{
    std::string toString(TransferErrorType type)
    {
        switch (type)
        {
            case TransferErrorType::None:
                return "None";
            case TransferErrorType::UserDeclined:
                return "UserDeclined";
            case TransferErrorType::SpawnFailure:
                return "SpawnFailure";
            case TransferErrorType::TransportFailure:
                return "TransportFailure";
            default:
                return "Unknown";
        }
    }
}
