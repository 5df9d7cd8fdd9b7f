#ifndef BRACEGLYPH_H
#define BRACEGLYPH_H

#include <QColor>
#include <QPainterPath>
#include <QPair>
#include <QPointF>
#include <QVector>

class QPainter;

enum class BraceFacing {
    Left,   // { tip points left
    Right   // } tip points right
};

struct CubicBezier {
    QPointF p0;
    QPointF p1;
    QPointF p2;
    QPointF p3;

    QPointF pointAt(qreal t) const;
    CubicBezier translated(const QPointF& offset) const;
};

struct BraceSpec {
    QPointF center;
    qreal height;
    qreal strokeWidth;
    QColor color;
    BraceFacing facing;

    BraceSpec() : height(0), strokeWidth(0), facing(BraceFacing::Left) {}
    BraceSpec(const QPointF& c, qreal h, qreal w, const QColor& col, BraceFacing f)
        : center(c), height(h), strokeWidth(w), color(col), facing(f) {}
};

/**
 * @brief One curly-brace glyph made of two cubic Bézier halves.
 *
 * The top half runs from the upper stem down to the tip, the bottom half
 * from the tip down to the lower stem. The stroke is approximated by the
 * union of discs of diameter strokeWidth stamped along both curves.
 */
class BraceGlyph
{
public:
    static constexpr int DefaultSteps = 200;

    explicit BraceGlyph(const BraceSpec& spec);

    const BraceSpec& spec() const { return m_spec; }

    // Control points relative to the glyph center
    QPair<CubicBezier, CubicBezier> localCurves() const;
    QPair<CubicBezier, CubicBezier> curves() const;

    QVector<QPointF> localSamplePoints(int steps = DefaultSteps) const;
    QVector<QPointF> samplePoints(int steps = DefaultSteps) const;

    QPainterPath outline(int steps = DefaultSteps) const;
    void draw(QPainter& painter, int steps = DefaultSteps) const;

    static qreal stemOffset(qreal height) { return height * 0.01; }
    static qreal tipExtend(qreal height) { return height * 0.22; }

private:
    static void appendSamples(QVector<QPointF>& points, const CubicBezier& curve, int steps);

    BraceSpec m_spec;
};

#endif // BRACEGLYPH_H
