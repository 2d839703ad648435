#ifndef LOCATOR_H
#define LOCATOR_H

#include <QString>
#include "../repo/repository.h"

namespace Bridge {

/**
 * @brief Finds records that already exist in the repository
 *
 * A locator is a JSON object of property constraints, read from an IR
 * attribute, e.g. {"CodeValue": "Pump-01", "ECClassId": "Plant:Pump"}.
 * Property names are matched case-insensitively; "ECClassId", "ClassId"
 * and "Class" restrict the class (subclasses match too).
 */
class Locator
{
public:
    static bool parse(const QString &text, LocatorQuery *query, QString *error = nullptr);

    /**
     * @brief Id of the single record matching a locator
     *
     * Fails when the locator is malformed, matches nothing, or matches
     * more than one record.
     * @return Record id, or empty on failure
     */
    static QString locateUnique(const Repository *repository, const QString &text,
                                QString *error = nullptr);
};

} // namespace Bridge

#endif // LOCATOR_H
