#include "ExternalTool.hpp"

#include "Logger.hpp"

#include <QByteArray>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

namespace ExternalTool {

std::optional<std::string> find_executable(const std::string& name)
{
    const QString exe = QStandardPaths::findExecutable(QString::fromStdString(name));
    if (exe.isEmpty()) {
        return std::nullopt;
    }
    return exe.toStdString();
}


std::optional<std::string> run_process(const std::string& program,
                                       const std::vector<std::string>& args,
                                       int timeout_ms,
                                       std::size_t max_output)
{
    auto logger = Logger::get_logger("core_logger");

    QStringList arguments;
    for (const auto& arg : args) {
        arguments << QString::fromStdString(arg);
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(QString::fromStdString(program), arguments);
    if (!process.waitForStarted()) {
        if (logger) {
            logger->debug("Failed to start '{}'", program);
        }
        return std::nullopt;
    }
    if (!process.waitForFinished(timeout_ms)) {
        process.kill();
        process.waitForFinished();
        if (logger) {
            logger->debug("'{}' timed out after {} ms", program, timeout_ms);
        }
        return std::nullopt;
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        if (logger) {
            logger->debug("'{}' exited with code {}", program, process.exitCode());
        }
        return std::nullopt;
    }

    const QByteArray output = process.readAllStandardOutput();
    std::string result(output.constData(), static_cast<std::size_t>(output.size()));
    if (result.size() > max_output) {
        result.resize(max_output);
    }
    return result;
}

} // namespace ExternalTool
