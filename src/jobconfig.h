#ifndef JOBCONFIG_H
#define JOBCONFIG_H

#include <QString>
#include "loaders/loader.h"

namespace Bridge {

/**
 * @brief Arguments of one synchronization job
 *
 * Job settings are stored as an INI file so that scheduled runs can be
 * described next to the data they read:
 *
 * @code
 * [connection]
 * kind=file
 * loaderNodeKey=loader
 * filepath=/data/plant.json
 *
 * [job]
 * containerNodeKey=Subject1
 * enableDelete=true
 * revisionHeader=Plant import
 *
 * [advanced]
 * debugLogging=false
 * @endcode
 */
class JobConfig
{
public:
    JobConfig() = default;

    DataConnection connection;
    QString containerNodeKey;       ///< Optional, must match the loader's container when set
    bool enableDelete = true;
    QString revisionHeader = DEFAULT_REVISION_HEADER;
    QString outputDir;              ///< Where the CLI writes snapshots, optional
    bool debugLogging = false;

    // ========== Persistence ==========

    /**
     * @brief Load job settings from an INI file
     * @return false if the file does not exist or is malformed
     */
    bool load(const QString &path, QString *error = nullptr);

    /**
     * @brief Save job settings to an INI file
     */
    bool save(const QString &path) const;

    /**
     * @brief Check the job can run
     *
     * Fails without a loader node key, and for file connections whose file
     * does not exist.
     */
    bool validate(QString *error = nullptr) const;

    static const QString DEFAULT_REVISION_HEADER;
};

} // namespace Bridge

#endif // JOBCONFIG_H
