/**
 * @file main.cpp
 * @brief Entry point for the Unfold icon generator.
 *
 * Renders the application icon once at the largest export size and writes
 * it, plus every downsampled variant, to the output directory.
 */

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include "iconexporter.h"
#include "iconrenderer.h"

/**
 * @brief Main entry point for the generator.
 *
 * The output directory defaults to "assets" relative to the working directory
 * and can be overridden in the form "-o <directory>".
 *
 * @param argc Number of command line arguments.
 * @param argv Array of command line argument strings.
 * @return 0 when every icon was written, 1 otherwise.
 */
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("unfold-icon");
    QCoreApplication::setApplicationVersion("1.0");

    const QString outputDir = IconExporter::outputDirFromArguments(QCoreApplication::arguments(), "assets");

    IconRenderer renderer;
    IconExporter exporter(outputDir);

    QObject::connect(&exporter, &IconExporter::iconWritten, [](const QString& path, int) {
        qInfo().noquote() << "Created" << QFileInfo(path).fileName();
    });

    qDebug() << "Rendering master icon at" << exporter.masterSize() << "into" << outputDir;
    if (!exporter.exportIcon(renderer)) {
        qCritical().noquote() << "Icon generation failed:" << exporter.lastError();
        return 1;
    }

    qInfo() << "All icons generated successfully!";
    return 0;
}
