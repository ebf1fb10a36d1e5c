/**
 * @file backup_stage.hpp
 * @brief Interface shared by the archive, database dump and config snapshot stages.
 */

#ifndef BACKUP_STAGE_HPP
#define BACKUP_STAGE_HPP

#include <string>
#include "backup_types.hpp"

/**
 * @brief One independent backup operation performed per site.
 *
 * Implementations report every failure through the returned outcome and leave no
 * partial artifact behind on failure.
 */
class BackupStage {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~BackupStage() = default;

    /**
     * @brief Human-readable stage name used in log lines (e.g. "Filesystem backup").
     */
    virtual std::string name() const = 0;

    /**
     * @brief Runs the stage for one site.
     *
     * @param site Site to back up.
     * @param context Destination and timestamp for this site's artifacts.
     * @return StageOutcome Success with the produced artifact, or Failure with a message.
     */
    virtual StageOutcome run(const Site& site, const BackupContext& context) = 0;
};

#endif // BACKUP_STAGE_HPP
