#ifndef EDITORSETTINGSMANAGER_H
#define EDITORSETTINGSMANAGER_H

#include <QString>
#include <QtGlobal>

/**
 * @brief Singleton class for managing box editor settings.
 *
 * Holds where annotation files are stored, the class assigned to new
 * boxes, and how many undo steps are kept.
 */
class EditorSettingsManager
{
public:
    static EditorSettingsManager& instance();

    // Annotation directory (relative paths resolve against the working directory)
    QString loadAnnotationDirectory() const;
    void saveAnnotationDirectory(const QString& path);

    // Class id for newly drawn boxes
    qint64 loadDefaultClassId() const;
    void saveDefaultClassId(qint64 classId);

    // Undo depth, 0 keeps every step
    int loadMaxHistorySize() const;
    void saveMaxHistorySize(int size);

    // Default values
    static QString defaultAnnotationDirectory() { return QStringLiteral("annotations"); }
    static constexpr qint64 kDefaultClassId = 0;
    static constexpr int kDefaultMaxHistorySize = 0;

    static constexpr const char* kSettingsKeyAnnotationDirectory = "editor/annotationDirectory";
    static constexpr const char* kSettingsKeyDefaultClassId = "editor/defaultClassId";
    static constexpr const char* kSettingsKeyMaxHistorySize = "editor/maxHistorySize";

private:
    EditorSettingsManager() = default;
    EditorSettingsManager(const EditorSettingsManager&) = delete;
    EditorSettingsManager& operator=(const EditorSettingsManager&) = delete;
};

#endif // EDITORSETTINGSMANAGER_H
