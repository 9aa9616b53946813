#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLIResult.h"

#include <QString>
#include <QStringList>

namespace Waysnip {
namespace CLI {

/**
 * @brief Parses the command line of the overlay binary
 */
class CLIHandler
{
public:
    /**
     * @brief Parse command line
     * @param arguments Command line arguments (including program name)
     */
    static CLIResult process(const QStringList& arguments);

    static QString getVersionText();
};

} // namespace CLI
} // namespace Waysnip

#endif // CLI_HANDLER_H
