#include "backup_types.hpp"
#include <utility>

const char* toString(BackupErrorCode code) {
    switch (code) {
        case BackupErrorCode::NoSitesFound: return "NoSitesFound";
        case BackupErrorCode::ConfigMissing: return "ConfigMissing";
        case BackupErrorCode::CredentialsIncomplete: return "CredentialsIncomplete";
        case BackupErrorCode::MissingDependency: return "MissingDependency";
        case BackupErrorCode::DestinationUnavailable: return "DestinationUnavailable";
        case BackupErrorCode::ProcessFailed: return "ProcessFailed";
        case BackupErrorCode::Timeout: return "Timeout";
        case BackupErrorCode::EmptyOutput: return "EmptyOutput";
        case BackupErrorCode::TransferFailed: return "TransferFailed";
    }
    return "Unknown";
}

StageOutcome StageOutcome::success(std::string message, BackupArtifact artifact) {
    StageOutcome outcome;
    outcome.status = StageStatus::Success;
    outcome.message = std::move(message);
    outcome.artifact = std::move(artifact);
    return outcome;
}

StageOutcome StageOutcome::failure(std::string message) {
    StageOutcome outcome;
    outcome.status = StageStatus::Failure;
    outcome.message = std::move(message);
    return outcome;
}

std::vector<BackupArtifact> SiteBackupResult::artifacts() const {
    std::vector<BackupArtifact> produced;
    for (const auto* outcome : {&archive, &database, &configSnapshot}) {
        if (outcome->ok() && outcome->artifact) {
            produced.push_back(*outcome->artifact);
        }
    }
    return produced;
}
