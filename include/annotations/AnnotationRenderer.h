#ifndef ANNOTATIONRENDERER_H
#define ANNOTATIONRENDERER_H

#include <QColor>
#include <QRectF>

#include "annotations/BoxAnnotation.h"

class ClassRegistry;
class QPainter;

/**
 * @brief Paints annotation boxes, their labels and the edit overlay.
 *
 * Unselected boxes use their class color, the selected box is drawn in
 * yellow with corner handles, and an in-progress drawing is shown as a
 * dashed preview.
 */
class AnnotationRenderer
{
public:
    explicit AnnotationRenderer(const ClassRegistry* registry = nullptr);

    void setRegistry(const ClassRegistry* registry) { m_registry = registry; }
    void setShowLabels(bool show) { m_showLabels = show; }
    bool showLabels() const { return m_showLabels; }

    void draw(QPainter& painter, const AnnotationSet& annotations,
              int selectedIndex = -1, const QRectF& drawingPreview = QRectF()) const;

    void drawBox(QPainter& painter, const BoxAnnotation& box, bool selected) const;
    void drawPreview(QPainter& painter, const QRectF& rect) const;

    QColor colorForClass(qint64 classId) const;

    static constexpr int kBoxPenWidth = 2;
    static constexpr int kSelectedPenWidth = 3;
    static constexpr int kHandleSize = 8;
    static QColor selectedColor() { return QColor(255, 255, 0); }
    static QColor previewColor() { return Qt::red; }

private:
    void drawHandles(QPainter& painter, const QRectF& rect) const;
    void drawLabel(QPainter& painter, const BoxAnnotation& box, const QColor& color) const;

    const ClassRegistry* m_registry = nullptr;
    bool m_showLabels = true;
};

#endif // ANNOTATIONRENDERER_H
