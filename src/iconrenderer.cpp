#include "iconrenderer.h"
#include "iconbackground.h"
#include <QPainter>
#include <QDebug>

IconRenderer::IconRenderer(const IconDesign& design)
    : m_design(design)
{
}

QImage IconRenderer::render(int size) const
{
    if (size <= 0) {
        qWarning() << "Cannot render icon with size" << size;
        return QImage();
    }

    QImage canvas = IconBackground::render(size, m_design.gradientStart, m_design.gradientEnd,
                                           m_design.cornerRadiusRatio);
    if (canvas.isNull()) {
        return canvas;
    }

    QPainter painter(&canvas);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    for (const BraceSpec& spec : innerBraces(size)) {
        BraceGlyph(spec).draw(painter, m_design.samplingSteps);
    }
    for (const Dot& dot : dots(size)) {
        drawDot(painter, dot);
    }
    // Outer braces go last and may overlap the inner ones
    for (const BraceSpec& spec : outerBraces(size)) {
        BraceGlyph(spec).draw(painter, m_design.samplingSteps);
    }
    painter.end();

    return canvas;
}

QList<BraceSpec> IconRenderer::innerBraces(int size) const
{
    return bracePair(size, m_design.innerOffsetRatio, m_design.solidColor);
}

QList<BraceSpec> IconRenderer::outerBraces(int size) const
{
    return bracePair(size, m_design.outerOffsetRatio, m_design.fadedColor);
}

QList<Dot> IconRenderer::dots(int size) const
{
    const qreal cx = size / 2;
    const qreal cy = size / 2;
    const qreal height = size * m_design.braceHeightRatio;
    const qreal spacing = size * m_design.dotSpacingRatio;
    const qreal y = cy + height * m_design.dotDropRatio;

    QList<Dot> result;
    for (int i = -1; i <= 1; i++) {
        result.append(Dot{QPointF(cx + i * spacing, y), size * m_design.dotRadiusRatio, m_design.solidColor});
    }
    return result;
}

QList<BraceSpec> IconRenderer::bracePair(int size, qreal offsetRatio, const QColor& color) const
{
    const qreal cx = size / 2;
    const qreal cy = size / 2;
    const qreal height = size * m_design.braceHeightRatio;
    const qreal strokeWidth = size * m_design.strokeWidthRatio;
    const qreal offset = size * offsetRatio;

    return {
        BraceSpec(QPointF(cx - offset, cy), height, strokeWidth, color, BraceFacing::Left),
        BraceSpec(QPointF(cx + offset, cy), height, strokeWidth, color, BraceFacing::Right)
    };
}

void IconRenderer::drawDot(QPainter& painter, const Dot& dot)
{
    painter.save();
    painter.setPen(Qt::NoPen);
    painter.setBrush(dot.color);
    painter.drawEllipse(dot.center, dot.radius, dot.radius);
    painter.restore();
}
