#pragma once

#include <optional>

#include <QHash>
#include <QJsonObject>
#include <QString>

#include "refoss_status.h"

namespace phicore::refoss::ipc {

namespace capability {
inline constexpr char kPower[] = "measure_power";
inline constexpr char kVoltage[] = "measure_voltage";
inline constexpr char kCurrent[] = "measure_current";
inline constexpr char kPowerFactor[] = "measure_power_factor";
inline constexpr char kApparentPower[] = "measure_apparent_power";
inline constexpr char kMonthEnergy[] = "meter_power";
inline constexpr char kWeekEnergy[] = "meter_power_week";
inline constexpr char kDayEnergy[] = "meter_power_day";
inline constexpr char kExportedEnergy[] = "meter_power.exported";
inline constexpr char kTemperature[] = "measure_temperature";
inline constexpr char kDayCost[] = "meter_cost_day";
} // namespace capability

namespace trigger {
inline constexpr char kPowerChanged[] = "power_changed";
inline constexpr char kMonthEnergy[] = "meter_power_month";
inline constexpr char kWeekEnergy[] = "meter_power_week";
inline constexpr char kDayEnergy[] = "meter_power_day";
} // namespace trigger

// Receives everything a logical device publishes. Implemented by the
// sidecar on top of the adapter IPC and by fakes in tests.
class HostCollaborator
{
public:
    virtual ~HostCollaborator() = default;

    virtual bool setCapability(const QString &name, double value, QString *error) = 0;
    virtual bool setAvailable(bool available, const QString &reason, QString *error) = 0;
    virtual bool emitTrigger(const QString &kind, const QJsonObject &tokens, QString *error) = 0;
};

// Apply-if-changed front end for a HostCollaborator. A failing host call
// is logged and never stops the remaining updates.
class CapabilityPublisher
{
public:
    CapabilityPublisher(HostCollaborator &host, const QString &label);

    void setPricing(double pricePerKwh, const QString &currency);
    double price() const { return m_price; }
    QString currency() const { return m_currency; }

    // Returns true when the value changed and the host accepted it.
    bool apply(const QString &name, const std::optional<double> &value);

    void applyChannel(const ChannelReading &reading);
    void applyTotals(const AggregateTotals &totals, const std::optional<double> &temperature);

    bool setAvailable(bool available, const QString &reason = {});
    std::optional<bool> available() const { return m_available; }

private:
    void applyDayCost(const std::optional<double> &dayEnergy);
    void fireTrigger(const QString &name, double value);

    HostCollaborator &m_host;
    QString m_label;
    QHash<QString, double> m_values;
    std::optional<bool> m_available;
    double m_price = 0.0;
    QString m_currency;
};

} // namespace phicore::refoss::ipc
