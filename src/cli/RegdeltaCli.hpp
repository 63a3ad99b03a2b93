#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace regdelta {

class RegdeltaCli
{
public:
    explicit RegdeltaCli(const AppConfig &config);

    // CLI dispatcher for import, runs, previews and queries.
    // Returns 0 on success, 2 when history is insufficient, 1 otherwise.
    int run(int argc, char *argv[]);

private:
    int runImport(const QStringList &args);
    int runLatest(const QStringList &args);
    int runCatchUp(const QStringList &args);
    int runDiff(const QStringList &args);
    int runSnapshots(const QStringList &args);
    int runAsk(const QStringList &args);

    int dispatch(const QString &command, const QStringList &args);

    AppConfig m_config;
};

} // namespace regdelta
