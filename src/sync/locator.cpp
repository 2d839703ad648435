#include "locator.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonObject>

namespace Bridge {

bool Locator::parse(const QString &text, LocatorQuery *query, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QString("Invalid locator %1").arg(text);
        return false;
    }

    LocatorQuery q;
    const QJsonObject obj = doc.object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const QString name = it.key().toLower();
        if (name == "ecclassid" || name == "classid" || name == "class") {
            q.classFullName = it.value().toString();
        } else {
            q.constraints.append(qMakePair(name, it.value()));
        }
    }

    if (q.constraints.isEmpty()) {
        if (error) *error = QString("Locator %1 has no property constraints").arg(text);
        return false;
    }

    *query = q;
    return true;
}

QString Locator::locateUnique(const Repository *repository, const QString &text, QString *error)
{
    LocatorQuery query;
    if (!parse(text, &query, error)) {
        return QString();
    }

    QString lookupError;
    const QStringList ids = repository->locate(query, &lookupError);
    if (!lookupError.isEmpty()) {
        if (error) *error = lookupError;
        return QString();
    }
    if (ids.isEmpty()) {
        if (error) *error = QString("No target entity found for %1").arg(text);
        return QString();
    }
    if (ids.size() > 1) {
        if (error) *error = QString("More than one entity found for %1").arg(text);
        return QString();
    }
    return ids.first();
}

} // namespace Bridge
