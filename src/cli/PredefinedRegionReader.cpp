#include "cli/PredefinedRegionReader.h"

#include <QDebug>
#include <QFile>
#include <QTextStream>

#include <cstdio>
#include <unistd.h>

namespace Waysnip {
namespace CLI {

RegionReadResult PredefinedRegionReader::parse(QTextStream& stream)
{
    RegionReadResult result;

    QString line;
    while (stream.readLineInto(&line)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const auto rect = SelectionRect::parse(line);
        if (rect) {
            result.regions.append(*rect);
        } else {
            ++result.ignoredLines;
        }
    }

    qDebug() << "PredefinedRegionReader: Parsed" << result.regions.size() << "regions,"
             << result.ignoredLines << "lines ignored";
    return result;
}

RegionReadResult PredefinedRegionReader::parseText(const QString& text)
{
    QString copy = text;
    QTextStream stream(&copy, QIODevice::ReadOnly);
    return parse(stream);
}

bool PredefinedRegionReader::isStdinPiped()
{
    return !isatty(fileno(stdin));
}

RegionReadResult PredefinedRegionReader::readFromStdinIfPiped()
{
    if (!isStdinPiped()) {
        return {};
    }

    QFile input;
    if (!input.open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "PredefinedRegionReader: Failed to open stdin:" << input.errorString();
        return {};
    }

    QTextStream stream(&input);
    return parse(stream);
}

} // namespace CLI
} // namespace Waysnip
