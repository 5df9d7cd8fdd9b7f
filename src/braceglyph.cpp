#include "braceglyph.h"
#include <QPainter>

QPointF CubicBezier::pointAt(qreal t) const
{
    const qreal u = 1 - t;
    return p0 * (u * u * u)
         + p1 * (3 * u * u * t)
         + p2 * (3 * u * t * t)
         + p3 * (t * t * t);
}

CubicBezier CubicBezier::translated(const QPointF& offset) const
{
    return {p0 + offset, p1 + offset, p2 + offset, p3 + offset};
}

BraceGlyph::BraceGlyph(const BraceSpec& spec)
    : m_spec(spec)
{
}

QPair<CubicBezier, CubicBezier> BraceGlyph::localCurves() const
{
    const qreal h = m_spec.height / 2;
    const qreal stem = stemOffset(m_spec.height);
    const qreal tip = tipExtend(m_spec.height);

    // Stems sit opposite the tip; a right-facing brace mirrors every x offset
    const qreal d = (m_spec.facing == BraceFacing::Left) ? -1.0 : 1.0;

    const QPointF tipPoint(d * tip, 0);

    CubicBezier top;
    top.p0 = QPointF(-d * stem, -h);
    top.p1 = QPointF(-d * stem, -h * 0.35);   // keeps the top end vertical
    top.p2 = QPointF(d * tip, -h * 0.15);
    top.p3 = tipPoint;

    CubicBezier bottom;
    bottom.p0 = tipPoint;
    bottom.p1 = QPointF(d * tip, h * 0.15);
    bottom.p2 = QPointF(-d * stem, h * 0.35);
    bottom.p3 = QPointF(-d * stem, h);

    return qMakePair(top, bottom);
}

QPair<CubicBezier, CubicBezier> BraceGlyph::curves() const
{
    const QPair<CubicBezier, CubicBezier> local = localCurves();
    return qMakePair(local.first.translated(m_spec.center), local.second.translated(m_spec.center));
}

void BraceGlyph::appendSamples(QVector<QPointF>& points, const CubicBezier& curve, int steps)
{
    for (int i = 0; i <= steps; i++) {
        points.append(curve.pointAt(qreal(i) / steps));
    }
}

QVector<QPointF> BraceGlyph::localSamplePoints(int steps) const
{
    QVector<QPointF> points;
    if (steps <= 0) {
        return points;
    }

    const QPair<CubicBezier, CubicBezier> local = localCurves();
    points.reserve(2 * (steps + 1));
    appendSamples(points, local.first, steps);
    appendSamples(points, local.second, steps);
    return points;
}

QVector<QPointF> BraceGlyph::samplePoints(int steps) const
{
    QVector<QPointF> points = localSamplePoints(steps);
    for (QPointF& point : points) {
        point += m_spec.center;
    }
    return points;
}

QPainterPath BraceGlyph::outline(int steps) const
{
    const qreal r = m_spec.strokeWidth / 2;

    // Same-orientation ellipses under winding fill give the union of the discs
    QPainterPath path;
    path.setFillRule(Qt::WindingFill);
    for (const QPointF& point : samplePoints(steps)) {
        path.addEllipse(point, r, r);
    }
    return path;
}

void BraceGlyph::draw(QPainter& painter, int steps) const
{
    painter.save();
    painter.setPen(Qt::NoPen);
    painter.setBrush(m_spec.color);
    painter.drawPath(outline(steps));
    painter.restore();
}
