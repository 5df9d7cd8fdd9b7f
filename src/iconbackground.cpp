#include "iconbackground.h"
#include <QPainter>
#include <QDebug>

QImage IconBackground::gradient(int size, const QColor& start, const QColor& end)
{
    QImage canvas(size, size, QImage::Format_ARGB32);
    if (canvas.isNull()) {
        qWarning() << "Failed to allocate gradient canvas of size" << size;
        return canvas;
    }

    const int r0 = start.red(), g0 = start.green(), b0 = start.blue();
    const int dr = end.red() - r0, dg = end.green() - g0, db = end.blue() - b0;
    const double span = 2.0 * size;

    for (int y = 0; y < size; y++) {
        QRgb* line = reinterpret_cast<QRgb*>(canvas.scanLine(y));
        for (int x = 0; x < size; x++) {
            const double ratio = (x + y) / span;
            line[x] = qRgba(int(r0 + dr * ratio), int(g0 + dg * ratio), int(b0 + db * ratio), 255);
        }
    }
    return canvas;
}

QImage IconBackground::roundedMask(int size, int radius)
{
    // Paint on an ARGB surface and keep only the alpha channel
    QImage surface(size, size, QImage::Format_ARGB32_Premultiplied);
    surface.fill(Qt::transparent);

    const int last = size - 1;

    QPainter painter(&surface);
    painter.setRenderHint(QPainter::Antialiasing, false);

    // Two overlapping rectangles cover everything but the radius x radius corner squares
    painter.fillRect(QRect(QPoint(radius, 0), QPoint(last - radius, last)), Qt::white);
    painter.fillRect(QRect(QPoint(0, radius), QPoint(last, last - radius)), Qt::white);

    if (radius > 0) {
        const QImage corner = cornerTile(radius);
        painter.drawImage(0, 0, corner);
        painter.drawImage(size - radius, 0, corner.mirrored(true, false));
        painter.drawImage(0, size - radius, corner.mirrored(false, true));
        painter.drawImage(size - radius, size - radius, corner.mirrored(true, true));
    }
    painter.end();

    return surface.convertToFormat(QImage::Format_Alpha8);
}

QImage IconBackground::cornerTile(int radius)
{
    QImage tile(radius, radius, QImage::Format_ARGB32_Premultiplied);
    tile.fill(Qt::transparent);

    // Pixel-inclusive bounding box [0, 2r], the tile clips it to the top-left quarter.
    // Qt angles run counter-clockwise from 3 o'clock in 1/16th degrees.
    const qreal extent = 2.0 * radius + 1;
    QPainter painter(&tile);
    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.setPen(Qt::NoPen);
    painter.setBrush(Qt::white);
    painter.drawPie(QRectF(0, 0, extent, extent), 90 * 16, 90 * 16);
    painter.end();
    return tile;
}

QImage IconBackground::applyMask(const QImage& canvas, const QImage& mask)
{
    if (canvas.size() != mask.size()) {
        qWarning() << "Mask size" << mask.size() << "does not match canvas size" << canvas.size();
        return QImage();
    }

    QImage result = canvas.convertToFormat(QImage::Format_ARGB32);
    const QImage alpha = mask.format() == QImage::Format_Alpha8
        ? mask
        : mask.convertToFormat(QImage::Format_Alpha8);

    for (int y = 0; y < result.height(); y++) {
        QRgb* line = reinterpret_cast<QRgb*>(result.scanLine(y));
        const uchar* coverage = alpha.constScanLine(y);
        for (int x = 0; x < result.width(); x++) {
            const QRgb pixel = line[x];
            line[x] = qRgba(qRed(pixel), qGreen(pixel), qBlue(pixel), qAlpha(pixel) * coverage[x] / 255);
        }
    }
    return result;
}

int IconBackground::cornerRadius(int size, qreal ratio)
{
    return int(size * ratio);
}

QImage IconBackground::render(int size, const QColor& start, const QColor& end, qreal radiusRatio)
{
    const int radius = cornerRadius(size, radiusRatio);
    qDebug() << "Rendering background" << size << "x" << size << "corner radius" << radius;
    return applyMask(gradient(size, start, end), roundedMask(size, radius));
}
