#ifndef PRESET_FUNCTIONS_HPP
#define PRESET_FUNCTIONS_HPP

#include <QString>
#include <QVector>

/**
 * @brief Catalogue of example formulas offered to front ends
 */
class PresetFunctions
{
public:
    struct Preset
    {
        QString expression;
        QString name;
        QString description;
    };

    static QVector<Preset> all();

    /**
     * @brief Find a preset by name (case-insensitive)
     * @return true if found, with the preset copied to result
     */
    static bool findByName(const QString& name, Preset& result);
};

#endif // PRESET_FUNCTIONS_HPP
