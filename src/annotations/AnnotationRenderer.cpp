#include "annotations/AnnotationRenderer.h"
#include "annotations/ClassRegistry.h"
#include "editor/BoxHandleHelper.h"

#include <QFontMetrics>
#include <QPainter>

AnnotationRenderer::AnnotationRenderer(const ClassRegistry* registry)
    : m_registry(registry)
{
}

QColor AnnotationRenderer::colorForClass(qint64 classId) const
{
    if (!m_registry) {
        return ClassRegistry::unknownClassColor();
    }
    return m_registry->classColor(classId);
}

void AnnotationRenderer::draw(QPainter& painter, const AnnotationSet& annotations,
                              int selectedIndex, const QRectF& drawingPreview) const
{
    for (int i = 0; i < annotations.size(); ++i) {
        if (i != selectedIndex) {
            drawBox(painter, annotations[i], false);
        }
    }

    // Selected box last so it stays on top
    if (selectedIndex >= 0 && selectedIndex < annotations.size()) {
        drawBox(painter, annotations[selectedIndex], true);
    }

    if (!drawingPreview.isEmpty()) {
        drawPreview(painter, drawingPreview);
    }
}

void AnnotationRenderer::drawBox(QPainter& painter, const BoxAnnotation& box, bool selected) const
{
    painter.save();

    const QRectF rect = box.rect().normalized();
    const QColor classColor = colorForClass(box.classId);

    if (selected) {
        QColor fill = selectedColor();
        fill.setAlpha(30);
        painter.setPen(QPen(selectedColor(), kSelectedPenWidth, Qt::SolidLine, Qt::SquareCap, Qt::MiterJoin));
        painter.setBrush(fill);
    } else {
        painter.setPen(QPen(classColor, kBoxPenWidth, Qt::SolidLine, Qt::SquareCap, Qt::MiterJoin));
        painter.setBrush(Qt::NoBrush);
    }
    painter.drawRect(rect);

    if (m_showLabels) {
        drawLabel(painter, box, classColor);
    }
    if (selected) {
        drawHandles(painter, rect);
    }

    painter.restore();
}

void AnnotationRenderer::drawPreview(QPainter& painter, const QRectF& rect) const
{
    painter.save();
    painter.setPen(QPen(previewColor(), kBoxPenWidth, Qt::DashLine));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rect.normalized());
    painter.restore();
}

void AnnotationRenderer::drawHandles(QPainter& painter, const QRectF& rect) const
{
    painter.setPen(QPen(Qt::black, 1));
    painter.setBrush(Qt::white);

    const double half = kHandleSize / 2.0;
    static constexpr BoxEdit::Handle kCorners[] = {
        BoxEdit::Handle::TopLeft, BoxEdit::Handle::TopRight,
        BoxEdit::Handle::BottomLeft, BoxEdit::Handle::BottomRight
    };
    for (BoxEdit::Handle corner : kCorners) {
        const QPointF center = BoxHandleHelper::cornerPosition(rect, corner);
        painter.drawRect(QRectF(center.x() - half, center.y() - half, kHandleSize, kHandleSize));
    }
}

void AnnotationRenderer::drawLabel(QPainter& painter, const BoxAnnotation& box, const QColor& color) const
{
    const QString text = m_registry ? m_registry->className(box.classId)
                                    : QStringLiteral("Unknown(%1)").arg(box.classId);
    const QFontMetrics metrics(painter.font());
    const QRectF textRect = metrics.boundingRect(text).adjusted(-3, -1, 3, 1);

    // Above the box, or inside it when there is no room
    QPointF topLeft(box.x, box.y - textRect.height());
    if (topLeft.y() < 0) {
        topLeft.setY(box.y);
    }
    const QRectF background(topLeft, textRect.size());

    painter.setPen(Qt::NoPen);
    painter.setBrush(color);
    painter.drawRect(background);

    painter.setPen(Qt::white);
    painter.drawText(background, Qt::AlignCenter, text);
}
