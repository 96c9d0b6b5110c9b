#include "refoss_capabilities.h"

#include "refoss_log.h"

namespace phicore::refoss::ipc {

CapabilityPublisher::CapabilityPublisher(HostCollaborator &host, const QString &label)
    : m_host(host)
    , m_label(label)
{
}

void CapabilityPublisher::setPricing(double pricePerKwh, const QString &currency)
{
    m_price = pricePerKwh;
    m_currency = currency;
}

bool CapabilityPublisher::apply(const QString &name, const std::optional<double> &value)
{
    if (!value.has_value())
        return false;

    const auto it = m_values.constFind(name);
    if (it != m_values.constEnd() && it.value() == *value)
        return false;

    QString error;
    if (!m_host.setCapability(name, *value, &error)) {
        qCWarning(adapterLog).noquote() << m_label << "setCapability" << name << "failed:" << error;
        return false;
    }

    m_values.insert(name, *value);
    fireTrigger(name, *value);
    return true;
}

void CapabilityPublisher::applyChannel(const ChannelReading &reading)
{
    apply(QString::fromLatin1(capability::kPower), reading.power);
    apply(QString::fromLatin1(capability::kVoltage), reading.voltage);
    apply(QString::fromLatin1(capability::kCurrent), reading.current);
    apply(QString::fromLatin1(capability::kMonthEnergy), reading.monthEnergy);
    apply(QString::fromLatin1(capability::kApparentPower), reading.apparentPower);
    apply(QString::fromLatin1(capability::kPowerFactor), reading.powerFactor);
    apply(QString::fromLatin1(capability::kWeekEnergy), reading.weekEnergy);
    apply(QString::fromLatin1(capability::kDayEnergy), reading.dayEnergy);
    apply(QString::fromLatin1(capability::kExportedEnergy), reading.monthReturnedEnergy);
    applyDayCost(reading.dayEnergy);
}

void CapabilityPublisher::applyTotals(const AggregateTotals &totals, const std::optional<double> &temperature)
{
    apply(QString::fromLatin1(capability::kPower), totals.power);
    apply(QString::fromLatin1(capability::kCurrent), totals.current);
    apply(QString::fromLatin1(capability::kVoltage), totals.voltage);
    apply(QString::fromLatin1(capability::kMonthEnergy), totals.monthEnergy);
    apply(QString::fromLatin1(capability::kWeekEnergy), totals.weekEnergy);
    apply(QString::fromLatin1(capability::kDayEnergy), totals.dayEnergy);
    apply(QString::fromLatin1(capability::kApparentPower), totals.apparentPower);
    apply(QString::fromLatin1(capability::kExportedEnergy), totals.monthReturnedEnergy);
    apply(QString::fromLatin1(capability::kTemperature), temperature);
    apply(QString::fromLatin1(capability::kPowerFactor), totals.powerFactor);
    applyDayCost(totals.dayEnergy);
}

bool CapabilityPublisher::setAvailable(bool available, const QString &reason)
{
    if (m_available.has_value() && *m_available == available)
        return true;

    QString error;
    if (!m_host.setAvailable(available, reason, &error)) {
        qCWarning(adapterLog).noquote() << m_label << "setAvailable(" << available << ") failed:" << error;
        return false;
    }
    m_available = available;
    return true;
}

void CapabilityPublisher::applyDayCost(const std::optional<double> &dayEnergy)
{
    if (!dayEnergy.has_value() || m_price <= 0.0)
        return;
    apply(QString::fromLatin1(capability::kDayCost), *dayEnergy * m_price);
}

void CapabilityPublisher::fireTrigger(const QString &name, double value)
{
    QString kind;
    QString token;
    if (name == QLatin1String(capability::kPower)) {
        kind = QString::fromLatin1(trigger::kPowerChanged);
        token = QStringLiteral("power");
    } else if (name == QLatin1String(capability::kMonthEnergy)) {
        kind = QString::fromLatin1(trigger::kMonthEnergy);
        token = QStringLiteral("energy");
    } else if (name == QLatin1String(capability::kWeekEnergy)) {
        kind = QString::fromLatin1(trigger::kWeekEnergy);
        token = QStringLiteral("energy");
    } else if (name == QLatin1String(capability::kDayEnergy)) {
        kind = QString::fromLatin1(trigger::kDayEnergy);
        token = QStringLiteral("energy");
    } else {
        return;
    }

    QJsonObject tokens;
    tokens.insert(token, value);
    QString error;
    if (!m_host.emitTrigger(kind, tokens, &error))
        qCWarning(adapterLog).noquote() << m_label << "trigger" << kind << "failed:" << error;
}

} // namespace phicore::refoss::ipc
