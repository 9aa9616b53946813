#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QString>

namespace Waysnip {
namespace CLI {

/**
 * @brief Options the overlay session starts with
 */
struct CLIOptions
{
    bool readStdinRegions = true;
};

/**
 * @brief CLI parsing result
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
    };

    Code code = Code::Success;
    QString message;
    bool exitRequested = false; // --help / --version already answered
    CLIOptions options;

    bool isSuccess() const { return code == Code::Success; }
    int exitCode() const { return static_cast<int>(code); }

    static CLIResult run(const CLIOptions& options)
    {
        CLIResult result;
        result.options = options;
        return result;
    }

    static CLIResult exitWith(const QString& msg)
    {
        CLIResult result;
        result.message = msg;
        result.exitRequested = true;
        return result;
    }

    static CLIResult error(Code code, const QString& msg)
    {
        CLIResult result;
        result.code = code;
        result.message = msg;
        result.exitRequested = true;
        return result;
    }
};

} // namespace CLI
} // namespace Waysnip

#endif // CLI_RESULT_H
