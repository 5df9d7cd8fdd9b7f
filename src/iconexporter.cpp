#include "iconexporter.h"
#include "icondesign.h"
#include "iconrenderer.h"
#include <QDir>
#include <QImageWriter>
#include <QDebug>
#include <algorithm>

IconExporter::IconExporter(const QString& outputDir, QObject *parent)
    : QObject(parent)
    , m_outputDir(outputDir)
    , m_sizes(IconDesign::defaultSizes())
{
}

void IconExporter::setSizes(const QList<int>& sizes)
{
    m_sizes.clear();
    for (int size : sizes) {
        if (size <= 0) {
            qWarning() << "Ignoring invalid icon size" << size;
            continue;
        }
        m_sizes.append(size);
    }
}

int IconExporter::masterSize() const
{
    if (m_sizes.isEmpty()) {
        return 0;
    }
    return *std::max_element(m_sizes.constBegin(), m_sizes.constEnd());
}

QString IconExporter::filePath(int size) const
{
    return QDir(m_outputDir).filePath(QString("icon-%1.png").arg(size));
}

bool IconExporter::exportIcon(const IconRenderer& renderer)
{
    const int size = masterSize();
    const QImage master = renderer.render(size);
    if (master.isNull()) {
        return fail(QString("Render produced an empty image for size %1 (%2)").arg(size).arg(filePath(size)));
    }
    return exportIcon(master);
}

bool IconExporter::exportIcon(const QImage& master)
{
    m_lastError.clear();

    if (master.isNull()) {
        return fail(QString("Render produced an empty master image for %1").arg(m_outputDir));
    }
    if (!ensureOutputDir()) {
        return false;
    }

    int written = 0;
    for (int size : m_sizes) {
        const QImage image = resized(master, size);
        if (image.isNull() || image.width() != size || image.height() != size) {
            return fail(QString("Failed to resize icon to %1x%1 for %2").arg(size).arg(filePath(size)));
        }

        const QString path = filePath(size);
        if (!writeImage(image, path)) {
            return false;
        }

        written++;
        emit iconWritten(path, size);
    }

    emit finished(written);
    return true;
}

QString IconExporter::outputDirFromArguments(const QStringList& arguments, const QString& defaultDir)
{
    // arguments.at(0) is the program name
    QString dir = defaultDir;
    for (int i = 1; i < arguments.size(); i++) {
        const QString& argument = arguments.at(i);
        if (argument == "-o") {
            if (i + 1 >= arguments.size()) {
                qWarning().noquote() << "Missing directory after -o, writing to" << dir;
                break;
            }
            dir = arguments.at(++i);
        } else {
            qWarning().noquote() << "Ignoring unknown argument" << argument;
        }
    }
    return dir;
}

QImage IconExporter::resized(const QImage& master, int size)
{
    if (master.width() == size && master.height() == size) {
        return master;
    }
    return master.scaled(size, size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
}

bool IconExporter::ensureOutputDir()
{
    if (!QDir().mkpath(m_outputDir)) {
        return fail(QString("Failed to create output directory %1").arg(QDir(m_outputDir).absolutePath()));
    }
    return true;
}

bool IconExporter::writeImage(const QImage& image, const QString& path)
{
    QImageWriter writer(path, "png");
    if (!writer.write(image)) {
        return fail(QString("Failed to write %1: %2").arg(path, writer.errorString()));
    }
    qDebug() << "Wrote" << path << image.size();
    return true;
}

bool IconExporter::fail(const QString& message)
{
    m_lastError = message;
    qWarning().noquote() << message;
    return false;
}
