#include "settings/EditorSettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>

EditorSettingsManager& EditorSettingsManager::instance()
{
    static EditorSettingsManager instance;
    return instance;
}

QString EditorSettingsManager::loadAnnotationDirectory() const
{
    auto settings = BoxLabel::getSettings();
    const QString path = settings.value(kSettingsKeyAnnotationDirectory,
                                        defaultAnnotationDirectory()).toString();
    return path.isEmpty() ? defaultAnnotationDirectory() : path;
}

void EditorSettingsManager::saveAnnotationDirectory(const QString& path)
{
    auto settings = BoxLabel::getSettings();
    settings.setValue(kSettingsKeyAnnotationDirectory, path);
}

qint64 EditorSettingsManager::loadDefaultClassId() const
{
    auto settings = BoxLabel::getSettings();
    bool ok = false;
    const qint64 value = settings.value(kSettingsKeyDefaultClassId, kDefaultClassId).toLongLong(&ok);
    return ok ? value : kDefaultClassId;
}

void EditorSettingsManager::saveDefaultClassId(qint64 classId)
{
    auto settings = BoxLabel::getSettings();
    settings.setValue(kSettingsKeyDefaultClassId, classId);
}

int EditorSettingsManager::loadMaxHistorySize() const
{
    auto settings = BoxLabel::getSettings();
    bool ok = false;
    const int value = settings.value(kSettingsKeyMaxHistorySize, kDefaultMaxHistorySize).toInt(&ok);
    if (!ok || value < 0) {
        return kDefaultMaxHistorySize;
    }
    return value;
}

void EditorSettingsManager::saveMaxHistorySize(int size)
{
    auto settings = BoxLabel::getSettings();
    settings.setValue(kSettingsKeyMaxHistorySize, qMax(0, size));
}
