#ifndef ICONBACKGROUND_H
#define ICONBACKGROUND_H

#include <QColor>
#include <QImage>

/**
 * @brief Builds the rounded-square gradient base layer of the icon.
 */
class IconBackground
{
public:
    /**
     * @brief Diagonal linear gradient from @p start at the top-left to @p end
     * towards the bottom-right, fully opaque.
     *
     * Each channel is interpolated along (x + y) / (2 * size) and truncated.
     */
    static QImage gradient(int size, const QColor& start, const QColor& end);

    /**
     * @brief Single-channel rounded-rectangle mask, 255 inside, 0 outside.
     */
    static QImage roundedMask(int size, int radius);

    /**
     * @brief Copy of @p canvas with its alpha multiplied by @p mask.
     * @return A null image when the dimensions differ.
     */
    static QImage applyMask(const QImage& canvas, const QImage& mask);

    static int cornerRadius(int size, qreal ratio);

    // Gradient clipped to the rounded square
    static QImage render(int size, const QColor& start, const QColor& end, qreal radiusRatio);

private:
    // Top-left radius x radius corner square with its quarter disc filled
    static QImage cornerTile(int radius);
};

#endif // ICONBACKGROUND_H
