#include "preset_functions.hpp"

QVector<PresetFunctions::Preset> PresetFunctions::all()
{
    QVector<Preset> presets;
    presets.append(Preset{ "x^2 + 2*x - 1", "Quadratic", QString::fromUtf8("x² + 2x - 1") });
    presets.append(Preset{ "sin(x)", "Sine", "sin(x)" });
    presets.append(Preset{ "cos(x)", "Cosine", "cos(x)" });
    presets.append(Preset{ "exp(x)", "Exponential", QString::fromUtf8("eˣ") });
    presets.append(Preset{ "ln(x)", "Natural Log", "ln(x)" });
    presets.append(Preset{ "x^3 - 3*x^2 + 2*x", "Cubic", QString::fromUtf8("x³ - 3x² + 2x") });
    presets.append(Preset{ "1/x", "Reciprocal", "1/x" });
    presets.append(Preset{ "sqrt(x)", "Square Root", QString::fromUtf8("√x") });
    return presets;
}

bool PresetFunctions::findByName(const QString& name, Preset& result)
{
    const QVector<Preset> presets = all();
    for (const Preset& preset : presets)
    {
        if (preset.name.compare(name.trimmed(), Qt::CaseInsensitive) == 0)
        {
            result = preset;
            return true;
        }
    }

    return false;
}
