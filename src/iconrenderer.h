#ifndef ICONRENDERER_H
#define ICONRENDERER_H

#include <QImage>
#include <QList>
#include "braceglyph.h"
#include "icondesign.h"

class QPainter;

struct Dot {
    QPointF center;
    qreal radius;
    QColor color;
};

/**
 * @brief Composes the full Unfold icon at a given size.
 *
 * Draw order: rounded gradient base, solid inner braces, dots, then the
 * faded outer braces over everything else.
 */
class IconRenderer
{
public:
    explicit IconRenderer(const IconDesign& design = IconDesign());

    const IconDesign& design() const { return m_design; }

    QImage render(int size) const;

    // Layout for a canvas of the given size, in draw order
    QList<BraceSpec> innerBraces(int size) const;
    QList<BraceSpec> outerBraces(int size) const;
    QList<Dot> dots(int size) const;

private:
    QList<BraceSpec> bracePair(int size, qreal offsetRatio, const QColor& color) const;
    static void drawDot(QPainter& painter, const Dot& dot);

    IconDesign m_design;
};

#endif // ICONRENDERER_H
