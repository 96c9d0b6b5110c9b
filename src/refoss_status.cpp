#include "refoss_status.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QStringList>

#include "refoss_log.h"

namespace phicore::refoss::ipc {

namespace {

constexpr int kMaxNestingDepth = 3;

const QStringList &containerKeys()
{
    static const QStringList keys{
        QStringLiteral("status"),
        QStringLiteral("channels"),
        QStringLiteral("em"),
        QStringLiteral("ems"),
        QStringLiteral("data"),
    };
    return keys;
}

const QStringList &energyKeys()
{
    static const QStringList keys{
        QStringLiteral("month_energy"),
        QStringLiteral("week_energy"),
        QStringLiteral("day_energy"),
        QStringLiteral("month_ret_energy"),
        QStringLiteral("week_ret_energy"),
        QStringLiteral("day_ret_energy"),
    };
    return keys;
}

// Children that never hold channel data.
bool isSkippedChild(const QString &key)
{
    return key == QLatin1String("sys")
        || key == QLatin1String("wifi")
        || key == QLatin1String("cloud")
        || key == QLatin1String("ws");
}

std::optional<double> readNumber(const QJsonValue &value)
{
    if (value.isDouble())
        return value.toDouble();
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok && std::isfinite(parsed))
            return parsed;
    }
    return std::nullopt;
}

std::optional<double> readField(const QJsonObject &obj, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        const auto value = readNumber(obj.value(QLatin1String(key)));
        if (value.has_value())
            return value;
    }
    return std::nullopt;
}

std::optional<int> declaredId(const QJsonObject &obj)
{
    const auto value = readNumber(obj.value(QStringLiteral("id")));
    if (!value.has_value() || std::floor(*value) != *value)
        return std::nullopt;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(*value);
}

std::optional<int> numericKey(const QString &key)
{
    bool ok = false;
    const int value = key.toInt(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

struct Candidate {
    QJsonObject record;
    std::optional<int> keyIndex;
};

// Assigns channel ids: declared id, then key index, then 1-based position.
void collect(const QVector<Candidate> &candidates, DeviceTelemetry *out)
{
    int position = 0;
    for (const Candidate &candidate : candidates) {
        ++position;
        int id = 0;
        if (const auto declared = declaredId(candidate.record); declared && *declared >= 1)
            id = *declared;
        else if (candidate.keyIndex && *candidate.keyIndex >= 1)
            id = *candidate.keyIndex;
        else
            id = position;

        if (out->channels.contains(id)) {
            qCDebug(adapterLog) << "duplicate channel id" << id << "in status payload, keeping the first";
            continue;
        }

        ChannelReading reading = parseChannelRecord(candidate.record);
        reading.channelId = id;
        out->channels.insert(id, reading);
        out->positions.append(id);
    }
}

QVector<Candidate> channelArray(const QJsonArray &array)
{
    QVector<Candidate> out;
    for (const QJsonValue &entry : array) {
        if (looksLikeChannel(entry))
            out.append(Candidate{entry.toObject(), std::nullopt});
    }
    return out;
}

using ShapeMatcher = std::function<bool(const QJsonValue &, int, DeviceTelemetry *)>;

struct ShapeParser {
    StatusShape shape;
    ShapeMatcher match;
};

bool matchNode(const QJsonValue &node, int depth, DeviceTelemetry *out);

bool matchArrayList(const QJsonValue &node, int, DeviceTelemetry *out)
{
    QVector<Candidate> candidates;
    if (node.isArray()) {
        candidates = channelArray(node.toArray());
    } else if (node.isObject()) {
        const QJsonObject obj = node.toObject();
        for (const QString &key : containerKeys()) {
            const QJsonValue value = obj.value(key);
            if (!value.isArray())
                continue;
            candidates = channelArray(value.toArray());
            if (!candidates.isEmpty())
                break;
        }
    }
    if (candidates.isEmpty())
        return false;
    collect(candidates, out);
    return true;
}

bool matchKeyedObject(const QJsonValue &node, int, DeviceTelemetry *out)
{
    if (!node.isObject())
        return false;

    QMap<int, Candidate> byKey;
    const QJsonObject obj = node.toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const auto index = numericKey(it.key());
        if (!index || !looksLikeChannel(it.value()))
            continue;
        byKey.insert(*index, Candidate{it.value().toObject(), index});
    }
    if (byKey.isEmpty())
        return false;

    collect(QVector<Candidate>(byKey.cbegin(), byKey.cend()), out);
    return true;
}

bool matchPrefixedKeys(const QJsonValue &node, int, DeviceTelemetry *out)
{
    if (!node.isObject())
        return false;

    static const QRegularExpression re(QStringLiteral("^([A-Za-z_]+):(\\d+)$"));

    // Records sharing an index (em:1 and emdata:1) describe the same channel.
    QMap<int, QJsonObject> merged;
    const QJsonObject obj = node.toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const QRegularExpressionMatch match = re.match(it.key());
        if (!match.hasMatch() || !looksLikeChannel(it.value()))
            continue;
        const int index = match.captured(2).toInt();
        QJsonObject &target = merged[index];
        const QJsonObject record = it.value().toObject();
        for (auto field = record.constBegin(); field != record.constEnd(); ++field) {
            if (!target.contains(field.key()))
                target.insert(field.key(), field.value());
        }
    }
    if (merged.isEmpty())
        return false;

    QVector<Candidate> candidates;
    for (auto it = merged.cbegin(); it != merged.cend(); ++it)
        candidates.append(Candidate{it.value(), it.key()});
    collect(candidates, out);
    return true;
}

bool matchNestedContainer(const QJsonValue &node, int depth, DeviceTelemetry *out)
{
    if (!node.isObject() || depth >= kMaxNestingDepth)
        return false;

    const QJsonObject obj = node.toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (isSkippedChild(it.key()))
            continue;
        if (!it.value().isObject() && !it.value().isArray())
            continue;
        if (matchNode(it.value(), depth + 1, out))
            return true;
    }
    return false;
}

bool matchSingleRecord(const QJsonValue &node, int, DeviceTelemetry *out)
{
    if (!looksLikeChannel(node))
        return false;
    collect(QVector<Candidate>{Candidate{node.toObject(), std::nullopt}}, out);
    return true;
}

const QVector<ShapeParser> &shapeParsers()
{
    static const QVector<ShapeParser> parsers{
        {StatusShape::ArrayList, matchArrayList},
        {StatusShape::KeyedObject, matchKeyedObject},
        {StatusShape::PrefixedKeys, matchPrefixedKeys},
        {StatusShape::NestedContainer, matchNestedContainer},
        {StatusShape::SingleRecord, matchSingleRecord},
    };
    return parsers;
}

bool matchNode(const QJsonValue &node, int depth, DeviceTelemetry *out)
{
    for (const ShapeParser &parser : shapeParsers()) {
        if (parser.match(node, depth, out)) {
            if (depth == 0)
                out->shape = parser.shape;
            return true;
        }
    }
    return false;
}

QJsonValue valueAtPath(const QJsonValue &root, const QString &path)
{
    QJsonValue current = root;
    const QStringList parts = path.split(QLatin1Char('.'));
    for (const QString &part : parts) {
        if (!current.isObject())
            return QJsonValue(QJsonValue::Undefined);
        current = current.toObject().value(part);
    }
    return current;
}

std::optional<double> findTemperature(const QJsonValue &node)
{
    static const QStringList paths{
        QStringLiteral("temperature"),
        QStringLiteral("temp"),
        QStringLiteral("tC"),
        QStringLiteral("sys.temperature"),
        QStringLiteral("sys.temp"),
        QStringLiteral("temperature.tC"),
        QStringLiteral("device_temperature"),
    };

    for (const QString &path : paths) {
        const auto raw = readNumber(valueAtPath(node, path));
        if (!raw.has_value())
            continue;
        const auto normalized = normalizeTemperature(*raw);
        if (normalized.has_value())
            return normalized;
        qCDebug(adapterLog) << "rejecting temperature" << *raw << "at" << path;
    }
    return std::nullopt;
}

void addTo(std::optional<double> *sum, const std::optional<double> &value)
{
    if (!value.has_value())
        return;
    *sum = sum->value_or(0.0) + *value;
}

} // namespace

const char *statusShapeName(StatusShape shape)
{
    switch (shape) {
    case StatusShape::None:
        return "None";
    case StatusShape::ArrayList:
        return "ArrayList";
    case StatusShape::KeyedObject:
        return "KeyedObject";
    case StatusShape::PrefixedKeys:
        return "PrefixedKeys";
    case StatusShape::NestedContainer:
        return "NestedContainer";
    case StatusShape::SingleRecord:
        return "SingleRecord";
    }
    return "None";
}

const ChannelReading *DeviceTelemetry::channel(int key) const
{
    auto it = channels.constFind(key);
    if (it != channels.constEnd())
        return &it.value();
    if (key >= 1 && key <= positions.size()) {
        it = channels.constFind(positions.at(key - 1));
        if (it != channels.constEnd())
            return &it.value();
    }
    return nullptr;
}

bool looksLikeChannel(const QJsonValue &value)
{
    if (!value.isObject())
        return false;
    const QJsonObject obj = value.toObject();
    if (obj.contains(QStringLiteral("id"))
        || obj.contains(QStringLiteral("power"))
        || obj.contains(QStringLiteral("current"))
        || obj.contains(QStringLiteral("voltage"))) {
        return true;
    }
    for (const QString &key : energyKeys()) {
        if (obj.contains(key))
            return true;
    }
    return false;
}

ChannelReading parseChannelRecord(const QJsonObject &record)
{
    ChannelReading reading;
    reading.power = readField(record, {"power"});
    reading.voltage = readField(record, {"voltage"});
    reading.current = readField(record, {"current"});
    reading.powerFactor = readField(record, {"pf", "power_factor"});
    reading.apparentPower = readField(record, {"apower", "aprt_power", "apparent_power"});
    if (!reading.apparentPower && reading.power && reading.powerFactor && *reading.powerFactor != 0.0)
        reading.apparentPower = *reading.power / *reading.powerFactor;

    reading.monthEnergy = readField(record, {"month_energy"});
    reading.weekEnergy = readField(record, {"week_energy"});
    reading.dayEnergy = readField(record, {"day_energy"});
    reading.monthReturnedEnergy = readField(record, {"month_ret_energy"});
    reading.weekReturnedEnergy = readField(record, {"week_ret_energy"});
    reading.dayReturnedEnergy = readField(record, {"day_ret_energy"});
    return reading;
}

AggregateTotals computeTotals(const QMap<int, ChannelReading> &channels)
{
    AggregateTotals totals;
    double voltageSum = 0.0;
    int voltageCount = 0;

    for (const ChannelReading &reading : channels) {
        addTo(&totals.power, reading.power);
        addTo(&totals.current, reading.current);
        addTo(&totals.apparentPower, reading.apparentPower);
        addTo(&totals.monthEnergy, reading.monthEnergy);
        addTo(&totals.weekEnergy, reading.weekEnergy);
        addTo(&totals.dayEnergy, reading.dayEnergy);
        addTo(&totals.monthReturnedEnergy, reading.monthReturnedEnergy);
        addTo(&totals.weekReturnedEnergy, reading.weekReturnedEnergy);
        addTo(&totals.dayReturnedEnergy, reading.dayReturnedEnergy);
        if (reading.voltage) {
            voltageSum += *reading.voltage;
            ++voltageCount;
        }
    }

    if (voltageCount > 0)
        totals.voltage = voltageSum / voltageCount;
    if (totals.power && totals.apparentPower && *totals.apparentPower > 0.0)
        totals.powerFactor = std::clamp(*totals.power / *totals.apparentPower, kMinPowerFactor, kMaxPowerFactor);
    return totals;
}

std::optional<double> normalizeTemperature(double raw)
{
    static constexpr double kDivisors[] = {1.0, 10.0, 100.0, 1000.0};
    for (double divisor : kDivisors) {
        const double value = raw / divisor;
        if (value >= -40.0 && value <= 125.0)
            return value;
    }
    return std::nullopt;
}

DeviceTelemetry normalizeStatus(const QJsonValue &payload)
{
    DeviceTelemetry out;

    QJsonValue root = payload;
    if (root.isObject() && root.toObject().contains(QStringLiteral("result")))
        root = root.toObject().value(QStringLiteral("result"));

    if (!matchNode(root, 0, &out)) {
        QStringList keys;
        if (root.isObject())
            keys = root.toObject().keys();
        qCWarning(adapterLog).noquote() << "no channel entries in status payload, keys:"
                                        << keys.join(QLatin1Char(','));
    } else {
        qCDebug(adapterLog) << "status shape" << statusShapeName(out.shape)
                            << "with" << out.channels.size() << "channels";
    }

    out.temperature = findTemperature(root);
    if (!out.temperature && root != payload)
        out.temperature = findTemperature(payload);

    out.total = computeTotals(out.channels);
    return out;
}

std::optional<ChannelReading> parseNotifyStatus(const QByteArray &body, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Push body is not a JSON object");
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    if (root.value(QStringLiteral("method")).toString() != QLatin1String("NotifyStatus")) {
        if (error)
            *error = QStringLiteral("Unexpected push method '%1'").arg(root.value(QStringLiteral("method")).toString());
        return std::nullopt;
    }

    const QJsonObject params = root.value(QStringLiteral("params")).toObject();
    QJsonObject em = params.value(QStringLiteral("em")).toObject();
    if (em.isEmpty())
        em = params.value(QStringLiteral("emmerge")).toObject();

    const auto id = declaredId(em);
    if (!id) {
        if (error)
            *error = QStringLiteral("Push carries no em.id");
        return std::nullopt;
    }

    ChannelReading reading = parseChannelRecord(em);
    reading.channelId = *id;

    // A zero-power push may omit the derived fields; clear them.
    if (reading.power && *reading.power == 0.0) {
        if (!reading.apparentPower)
            reading.apparentPower = 0.0;
        if (!reading.current)
            reading.current = 0.0;
        if (!reading.powerFactor)
            reading.powerFactor = 0.0;
    }

    if (error)
        error->clear();
    return reading;
}

} // namespace phicore::refoss::ipc
