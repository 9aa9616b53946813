#ifndef PREDEFINED_REGION_READER_H
#define PREDEFINED_REGION_READER_H

#include "region/SelectionRect.h"

#include <QString>
#include <QVector>

class QTextStream;

namespace Waysnip {
namespace CLI {

struct RegionReadResult
{
    QVector<SelectionRect> regions;
    int ignoredLines = 0;
};

/**
 * @brief Reads predefined regions, one "x1,y1 x2,y2" per line
 *
 * Malformed lines and lines with a non-positive area are skipped. Blank
 * lines are skipped without being counted.
 */
class PredefinedRegionReader
{
public:
    static RegionReadResult parse(QTextStream& stream);
    static RegionReadResult parseText(const QString& text);

    /**
     * @brief True when stdin is a pipe or file rather than a terminal
     */
    static bool isStdinPiped();

    /**
     * @brief Read all of stdin when it is piped; empty result otherwise
     */
    static RegionReadResult readFromStdinIfPiped();

private:
    PredefinedRegionReader() = delete;
};

} // namespace CLI
} // namespace Waysnip

#endif // PREDEFINED_REGION_READER_H
