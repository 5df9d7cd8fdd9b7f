#ifndef ICONDESIGN_H
#define ICONDESIGN_H

#include <QColor>
#include <QList>

/**
 * @brief Fixed design constants of the Unfold application icon.
 *
 * All lengths are fractions of the canvas size (or of the brace height where
 * noted) so the same design renders at any master resolution.
 */
struct IconDesign {
    // Diagonal gradient stops
    QColor gradientStart = QColor(64, 192, 180);   // Teal
    QColor gradientEnd = QColor(80, 140, 200);     // Blue

    qreal cornerRadiusRatio = 0.22;

    // Braces
    qreal braceHeightRatio = 0.55;
    qreal strokeWidthRatio = 0.045;
    qreal innerOffsetRatio = 0.18;
    qreal outerOffsetRatio = 0.28;
    QColor solidColor = QColor(255, 255, 255, 230);
    QColor fadedColor = QColor(255, 255, 255, 80);
    int samplingSteps = 200;

    // Dots, vertical position relative to the brace height
    qreal dotRadiusRatio = 0.025;
    qreal dotSpacingRatio = 0.07;
    qreal dotDropRatio = 0.48;

    static QList<int> defaultSizes() { return {1024, 512, 256, 128, 64, 32, 16}; }
};

#endif // ICONDESIGN_H
