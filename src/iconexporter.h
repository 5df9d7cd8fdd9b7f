#ifndef ICONEXPORTER_H
#define ICONEXPORTER_H

#include <QObject>
#include <QImage>
#include <QList>
#include <QString>
#include <QStringList>

class IconRenderer;

/**
 * @brief Writes the master icon and its downsampled variants as PNG files.
 *
 * Every size is derived from a single master image so all outputs stay
 * visually consistent. Files are named icon-<size>.png and overwritten on
 * each run. Export stops at the first failure; lastError() names the step
 * and the path involved.
 */
class IconExporter : public QObject
{
    Q_OBJECT

public:
    explicit IconExporter(const QString& outputDir, QObject *parent = nullptr);

    QString outputDir() const { return m_outputDir; }

    QList<int> sizes() const { return m_sizes; }
    void setSizes(const QList<int>& sizes);
    int masterSize() const;

    QString filePath(int size) const;
    QString lastError() const { return m_lastError; }

    bool exportIcon(const IconRenderer& renderer);
    bool exportIcon(const QImage& master);

    static QImage resized(const QImage& master, int size);

    // Output directory from "-o <directory>"; anything else is logged and ignored
    static QString outputDirFromArguments(const QStringList& arguments, const QString& defaultDir);

signals:
    void iconWritten(const QString& path, int size);
    void finished(int count);

private:
    bool ensureOutputDir();
    bool writeImage(const QImage& image, const QString& path);
    bool fail(const QString& message);

    QString m_outputDir;
    QList<int> m_sizes;
    QString m_lastError;
};

#endif // ICONEXPORTER_H
