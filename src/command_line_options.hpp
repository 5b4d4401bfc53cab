#ifndef COMMAND_LINE_OPTIONS_HPP
#define COMMAND_LINE_OPTIONS_HPP

#include "calculus_settings.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>

/**
 * @brief The CommandLineOptions class turns calcscope's arguments into a request
 *
 * Values are layered: built-in CalculusSettings defaults, then the INI file
 * named by --config, then the individual options. The expression is parsed
 * once here so a bad formula is rejected before any mode runs.
 *
 * An expression that starts with '-' must follow "--", otherwise it is read
 * as an option.
 */
class CommandLineOptions
{
public:
    enum Status
    {
        PROCEED,       // Run getMode() on getExpression()
        LIST_PRESETS,
        SHOW_HELP,
        SHOW_VERSION,
        FAILED         // See getError()
    };

    CommandLineOptions();

    /**
     * @brief Parse the full argument list (program name first)
     */
    Status resolve(const QStringList& arguments);

    QString getMode() const { return mode; }
    QString getExpression() const { return expression; }
    CalculusSettings getSettings() const { return settings; }
    QString getError() const { return errorText; }

    /**
     * @brief Whether --from, --to or --steps was given
     *
     * Derivative mode prints a curve instead of a single slope when set.
     */
    bool hasExplicitRange() const { return explicitRange; }

    QString helpText() const { return parser.helpText(); }

    static QStringList modes();

private:
    Status fail(const QString& message);
    bool readDouble(const QCommandLineOption& option, double& value);
    bool readCount(const QCommandLineOption& option, int& value);

    QCommandLineParser parser;
    QCommandLineOption helpOption;
    QCommandLineOption versionOption;
    QCommandLineOption modeOption;
    QCommandLineOption atOption;
    QCommandLineOption fromOption;
    QCommandLineOption toOption;
    QCommandLineOption stepsOption;
    QCommandLineOption methodOption;
    QCommandLineOption configOption;
    QCommandLineOption presetsOption;

    QString mode;
    QString expression;
    CalculusSettings settings;
    bool explicitRange;
    QString errorText;
};

#endif // COMMAND_LINE_OPTIONS_HPP
