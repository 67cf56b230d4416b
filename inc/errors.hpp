#pragma once
#include <stdexcept>
#include <string>

namespace NWorkspace {

    enum class EWorkspaceError {
        NotFound,
        DuplicateWorkspace,
        CannotRemoveCurrent,
        AlreadyCurrent,
        SwitchInProgress,
        RemoteUnreachable,
        RemoteRejected,
        CacheCommitFailure,
        Cancelled,
        AcknowledgementRequired,
        InvalidArgument,
        StorageFailure
    };

    inline const char* ToString(EWorkspaceError code) {
        switch (code) {
            case EWorkspaceError::NotFound:
                return "NotFound";
            case EWorkspaceError::DuplicateWorkspace:
                return "DuplicateWorkspace";
            case EWorkspaceError::CannotRemoveCurrent:
                return "CannotRemoveCurrent";
            case EWorkspaceError::AlreadyCurrent:
                return "AlreadyCurrent";
            case EWorkspaceError::SwitchInProgress:
                return "SwitchInProgress";
            case EWorkspaceError::RemoteUnreachable:
                return "RemoteUnreachable";
            case EWorkspaceError::RemoteRejected:
                return "RemoteRejected";
            case EWorkspaceError::CacheCommitFailure:
                return "CacheCommitFailure";
            case EWorkspaceError::Cancelled:
                return "Cancelled";
            case EWorkspaceError::AcknowledgementRequired:
                return "AcknowledgementRequired";
            case EWorkspaceError::InvalidArgument:
                return "InvalidArgument";
            case EWorkspaceError::StorageFailure:
                return "StorageFailure";
        }
        return "Unknown";
    }

    class TWorkspaceError: public std::runtime_error {
    public:
        TWorkspaceError(EWorkspaceError code, const std::string& message)
            : std::runtime_error(std::string(ToString(code)) + ": " + message)
            , Code_(code) {
        }

        EWorkspaceError Code() const {
            return Code_;
        }

        // Only transport-level failures are worth another attempt.
        bool IsRetryable() const {
            return Code_ == EWorkspaceError::RemoteUnreachable;
        }

        // Terminal failures block further switches until the user acknowledges them.
        bool IsTerminal() const {
            return Code_ == EWorkspaceError::RemoteRejected ||
                   Code_ == EWorkspaceError::CacheCommitFailure;
        }

    private:
        EWorkspaceError Code_;
    };

} // namespace NWorkspace
