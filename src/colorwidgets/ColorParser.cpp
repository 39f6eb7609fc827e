#include "colorwidgets/ColorParser.h"

#include <QColor>
#include <QRegularExpression>

#include <cmath>
#include <cstring>

namespace tinct {
namespace colorwidgets {

ColorParseResult ColorParser::parse(const QString& text)
{
    return parseText(text, std::nullopt);
}

ColorParseResult ColorParser::parse(const QString& text, PolarModel model)
{
    return parseText(text, model);
}

ColorParseResult ColorParser::parseText(const QString& text, std::optional<PolarModel> model)
{
    const QString s = text.trimmed().toLower();
    if (s.isEmpty()) {
        return ColorParseResult::failure(text, "empty color string");
    }

    const PolarModel rgbModel = model.value_or(PolarModel::Hsv);

    // rgb(...), hsl(...), vec3(...)
    static const QRegularExpression functionRe(R"(^([a-z][a-z0-9]*)\s*\((.*)\)$)");
    auto match = functionRe.match(s);
    if (match.hasMatch()) {
        return parseFunction(text, match.captured(1), match.captured(2), model);
    }
    if (s.contains('(') || s.contains(')')) {
        return ColorParseResult::failure(text, "malformed color function");
    }

    if (s.startsWith('#')) {
        return parseHex(text, s.mid(1), rgbModel);
    }

    // Bare hex digits take precedence over names ("add" is #aadddd)
    static const QRegularExpression bareHexRe("^[0-9a-f]{3,8}$");
    if (bareHexRe.match(s).hasMatch()) {
        return parseHex(text, s, rgbModel);
    }

    // CSS color names
    static const QRegularExpression nameRe("^[a-z]+$");
    if (nameRe.match(s).hasMatch()) {
        QColor named(s);
        if (named.isValid()) {
            return ColorParseResult::success(Color::fromQColor(named, rgbModel));
        }
        return ColorParseResult::failure(text, QString("unknown color name '%1'").arg(s));
    }

    return ColorParseResult::failure(
        text, "expected a hex color, a color function such as rgb() or hsl(), or a color name");
}

// ========== Hex ==========

ColorParseResult ColorParser::parseHex(const QString& text, const QString& digits,
                                       PolarModel model)
{
    static const QRegularExpression hexRe("^[0-9a-f]*$");
    if (!hexRe.match(digits).hasMatch()) {
        return ColorParseResult::failure(text, "invalid hex digit");
    }

    QString d = digits;
    // #rgb / #rgba -> #rrggbb / #rrggbbaa
    if (d.length() == 3 || d.length() == 4) {
        QString expanded;
        for (QChar c : d) {
            expanded += c;
            expanded += c;
        }
        d = expanded;
    }
    if (d.length() != 6 && d.length() != 8) {
        return ColorParseResult::failure(
            text, QString("expected 3, 4, 6 or 8 hex digits, got %1").arg(digits.length()));
    }

    auto channel = [&d](int index) { return d.mid(index * 2, 2).toInt(nullptr, 16) / 255.0f; };

    const float a = d.length() == 8 ? channel(3) : 1.0f;
    return ColorParseResult::success(Color::fromRgb(channel(0), channel(1), channel(2), a, model));
}

// ========== Functions ==========

ColorParseResult ColorParser::parseFunction(const QString& text, const QString& name,
                                            const QString& body,
                                            std::optional<PolarModel> model)
{
    static const QStringList knownFunctions = {"rgb", "rgba", "hsl", "hsla",
                                               "hsv", "hsva", "vec3", "vec4"};
    if (!knownFunctions.contains(name)) {
        return ColorParseResult::failure(text, QString("unknown color function '%1()'").arg(name));
    }

    const bool isVector = name == QLatin1String("vec3") || name == QLatin1String("vec4");

    QString reason;
    std::optional<Arguments> args = splitArguments(body, isVector, &reason);
    if (!args) {
        return ColorParseResult::failure(text, QString("%1(): %2").arg(name, reason));
    }

    auto badArgument = [&](const QString& arg, const QString& expected) {
        return ColorParseResult::failure(
            text, QString("%1(): invalid argument '%2', expected %3").arg(name, arg, expected));
    };

    float alpha = 1.0f;
    if (!args->alpha.isEmpty()) {
        std::optional<float> a = parseAlpha(args->alpha);
        if (!a) {
            return badArgument(args->alpha, "a number or percentage");
        }
        alpha = *a;
    }

    const QStringList& c = args->channels;

    if (name == QLatin1String("rgb") || name == QLatin1String("rgba")) {
        float rgb[3];
        for (int i = 0; i < 3; ++i) {
            std::optional<float> v = parseRgbChannel(c[i]);
            if (!v) {
                return badArgument(c[i], "a number or percentage");
            }
            rgb[i] = *v;
        }
        return ColorParseResult::success(
            Color::fromRgb(rgb[0], rgb[1], rgb[2], alpha, model.value_or(PolarModel::Hsv)));
    }

    if (isVector) {
        const int expected = name == QLatin1String("vec3") ? 3 : 4;
        const int given = c.size() + (args->alpha.isEmpty() ? 0 : 1);
        if (given != expected) {
            return ColorParseResult::failure(
                text, QString("%1(): expected %2 components, got %3").arg(name).arg(expected).arg(given));
        }
        float rgb[3];
        for (int i = 0; i < 3; ++i) {
            std::optional<float> v = parseUnit(c[i]);
            if (!v) {
                return badArgument(c[i], "a number");
            }
            rgb[i] = *v;
        }
        return ColorParseResult::success(
            Color::fromRgb(rgb[0], rgb[1], rgb[2], alpha, model.value_or(PolarModel::Hsv)));
    }

    // hsl / hsla / hsv / hsva
    std::optional<float> h = parseHue(c[0]);
    if (!h) {
        return badArgument(c[0], "an angle");
    }
    std::optional<float> sat = parsePercentage(c[1], args->legacy);
    if (!sat) {
        return badArgument(c[1], "a percentage");
    }
    std::optional<float> level = parsePercentage(c[2], args->legacy);
    if (!level) {
        return badArgument(c[2], "a percentage");
    }

    Color color = name.startsWith(QLatin1String("hsl")) ? Color::fromHsl(*h, *sat, *level, alpha)
                                                        : Color::fromHsv(*h, *sat, *level, alpha);
    if (model) {
        color = color.toModel(*model);
    }
    return ColorParseResult::success(color);
}

std::optional<ColorParser::Arguments> ColorParser::splitArguments(const QString& body,
                                                                   bool bareFourth,
                                                                   QString* reason)
{
    Arguments args;

    if (body.contains(',')) {
        // Legacy syntax: a, b, c[, alpha]
        if (body.contains('/')) {
            *reason = "cannot mix ',' and '/' separators";
            return std::nullopt;
        }
        QStringList parts = body.split(',');
        for (QString& part : parts) {
            part = part.trimmed();
            if (part.isEmpty()) {
                *reason = "empty argument";
                return std::nullopt;
            }
        }
        if (parts.size() != 3 && parts.size() != 4) {
            *reason = QString("expected 3 or 4 arguments, got %1").arg(parts.size());
            return std::nullopt;
        }
        if (parts.size() == 4) {
            args.alpha = parts.takeLast();
        }
        args.channels = parts;
        args.legacy = true;
        return args;
    }

    // Space syntax: a b c [/ alpha]
    const QStringList halves = body.split('/');
    if (halves.size() > 2) {
        *reason = "more than one '/' separator";
        return std::nullopt;
    }

    static const QRegularExpression spaceRe("\\s+");
    QStringList parts = halves.first().split(spaceRe, Qt::SkipEmptyParts);

    if (halves.size() == 2) {
        args.alpha = halves.last().trimmed();
        if (args.alpha.isEmpty() || args.alpha.contains(' ')) {
            *reason = "expected a single alpha value after '/'";
            return std::nullopt;
        }
        if (parts.size() != 3) {
            *reason = QString("expected 3 arguments before '/', got %1").arg(parts.size());
            return std::nullopt;
        }
    } else if (parts.size() == 4 && bareFourth) {
        // vec4(r g b a)
        args.alpha = parts.takeLast();
    } else if (parts.size() != 3) {
        *reason = QString("expected 3 arguments, got %1").arg(parts.size());
        return std::nullopt;
    }

    args.channels = parts;
    return args;
}

// ========== Tokens ==========

std::optional<double> ColorParser::parseNumber(const QString& token)
{
    static const QRegularExpression numberRe(R"(^[+-]?(\d+(\.\d*)?|\.\d+)(e[+-]?\d+)?$)");
    if (!numberRe.match(token).hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = token.toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<float> ColorParser::parseRgbChannel(const QString& token)
{
    if (token.endsWith('%')) {
        std::optional<double> v = parseNumber(token.chopped(1));
        if (!v)
            return std::nullopt;
        return static_cast<float>(qBound(0.0, *v / 100.0, 1.0));
    }
    std::optional<double> v = parseNumber(token);
    if (!v)
        return std::nullopt;
    return static_cast<float>(qBound(0.0, *v, 255.0) / 255.0);
}

std::optional<float> ColorParser::parsePercentage(const QString& token, bool legacy)
{
    const bool percent = token.endsWith('%');
    std::optional<double> v = parseNumber(percent ? token.chopped(1) : token);
    if (!v)
        return std::nullopt;
    // Bare numbers are percentages (CSS Color 4) unless a legacy unit fraction
    if (!percent && legacy && *v >= 0.0 && *v <= 1.0)
        return static_cast<float>(*v);
    return static_cast<float>(qBound(0.0, *v / 100.0, 1.0));
}

std::optional<float> ColorParser::parseAlpha(const QString& token)
{
    if (token.endsWith('%')) {
        return parsePercentage(token);
    }
    return parseUnit(token);
}

std::optional<float> ColorParser::parseUnit(const QString& token)
{
    std::optional<double> v = parseNumber(token);
    if (!v)
        return std::nullopt;
    return static_cast<float>(qBound(0.0, *v, 1.0));
}

std::optional<float> ColorParser::parseHue(const QString& token)
{
    struct Unit
    {
        const char* suffix;
        double perTurn;
    };
    // "grad" before "rad"
    static const Unit units[] = {
        {"grad", 400.0}, {"turn", 1.0}, {"deg", 360.0}, {"rad", 2.0 * M_PI}};

    QString number = token;
    double perTurn = 360.0;
    for (const Unit& unit : units) {
        if (token.endsWith(QLatin1String(unit.suffix))) {
            number = token.chopped(static_cast<int>(std::strlen(unit.suffix)));
            perTurn = unit.perTurn;
            break;
        }
    }

    std::optional<double> v = parseNumber(number);
    if (!v)
        return std::nullopt;
    return ColorConversion::wrap(static_cast<float>(*v / perTurn), 1.0f);
}

}  // namespace colorwidgets
}  // namespace tinct
