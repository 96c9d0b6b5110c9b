#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QMap>
#include <QString>
#include <QVector>

namespace phicore::refoss::ipc {

struct ChannelReading {
    int channelId = 0;

    std::optional<double> power;          // W
    std::optional<double> voltage;        // V
    std::optional<double> current;        // A
    std::optional<double> powerFactor;
    std::optional<double> apparentPower;  // VA

    // kWh
    std::optional<double> monthEnergy;
    std::optional<double> weekEnergy;
    std::optional<double> dayEnergy;
    std::optional<double> monthReturnedEnergy;
    std::optional<double> weekReturnedEnergy;
    std::optional<double> dayReturnedEnergy;
};

// Exporting channels report a negative power factor.
inline constexpr double kMinPowerFactor = -1.0;
inline constexpr double kMaxPowerFactor = 1.0;

// Sums over the channels that reported the specific field.
struct AggregateTotals {
    std::optional<double> power;
    std::optional<double> current;
    std::optional<double> apparentPower;
    std::optional<double> voltage;       // mean
    std::optional<double> powerFactor;   // power / apparentPower, clamped to [-1, 1]
    std::optional<double> monthEnergy;
    std::optional<double> weekEnergy;
    std::optional<double> dayEnergy;
    std::optional<double> monthReturnedEnergy;
    std::optional<double> weekReturnedEnergy;
    std::optional<double> dayReturnedEnergy;
};

enum class StatusShape {
    None,
    ArrayList,
    KeyedObject,
    PrefixedKeys,
    NestedContainer,
    SingleRecord
};

const char *statusShapeName(StatusShape shape);

struct DeviceTelemetry {
    QMap<int, ChannelReading> channels;
    // Declared channel id for each 1-based position in the payload.
    QVector<int> positions;
    AggregateTotals total;
    std::optional<double> temperature;
    StatusShape shape = StatusShape::None;

    // Looks the reading up by declared id first, then by 1-based position.
    const ChannelReading *channel(int key) const;
    bool isEmpty() const { return channels.isEmpty(); }
};

DeviceTelemetry normalizeStatus(const QJsonValue &payload);

// Maps one raw channel object onto a reading. channelId is left to the caller.
ChannelReading parseChannelRecord(const QJsonObject &record);
bool looksLikeChannel(const QJsonValue &value);

AggregateTotals computeTotals(const QMap<int, ChannelReading> &channels);

// Accepts degrees directly, or tenths/hundredths/thousandths of a degree.
std::optional<double> normalizeTemperature(double raw);

// Decodes a NotifyStatus push body into one reading.
std::optional<ChannelReading> parseNotifyStatus(const QByteArray &body, QString *error = nullptr);

} // namespace phicore::refoss::ipc
