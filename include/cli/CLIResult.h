#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QString>

namespace Tinct {
namespace CLI {

/**
 * @brief CLI execution result
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
        Cancelled = 3,
    };

    Code code = Code::Success;
    QString message;

    bool isSuccess() const { return code == Code::Success; }

    static CLIResult success(const QString& msg = QString()) { return {Code::Success, msg}; }

    static CLIResult error(Code code, const QString& msg) { return {code, msg}; }
};

} // namespace CLI
} // namespace Tinct

#endif // CLI_RESULT_H
