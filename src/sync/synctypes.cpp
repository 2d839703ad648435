#include "synctypes.h"

namespace Bridge {

QString itemStateName(ItemState state)
{
    switch (state) {
    case ItemState::Unchanged: return QStringLiteral("Unchanged");
    case ItemState::New:       return QStringLiteral("New");
    case ItemState::Changed:   return QStringLiteral("Changed");
    }
    return QString();
}

QString runPhaseName(RunPhase phase)
{
    switch (phase) {
    case RunPhase::Idle:              return QStringLiteral("Idle");
    case RunPhase::LoaderSync:        return QStringLiteral("LoaderSync");
    case RunPhase::DomainSchemaSync:  return QStringLiteral("DomainSchemaSync");
    case RunPhase::DynamicSchemaSync: return QStringLiteral("DynamicSchemaSync");
    case RunPhase::DataSync:          return QStringLiteral("DataSync");
    case RunPhase::OrphanSync:        return QStringLiteral("OrphanSync");
    case RunPhase::ExtentsSync:       return QStringLiteral("ExtentsSync");
    case RunPhase::Done:              return QStringLiteral("Done");
    case RunPhase::Failed:            return QStringLiteral("Failed");
    }
    return QString();
}

} // namespace Bridge
