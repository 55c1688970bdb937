#include "BluezGateway.hpp"
#include "../core/Logger.hpp"
#include <bluetray/Constants.hpp>
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QDBusServiceWatcher>
#include <QDBusVariant>
#include <QMap>
#include <QStringList>
#include <QVariantMap>
#include <map>
#include <mutex>

namespace bluetray {

namespace {

const QString BLUEZ_SERVICE = QStringLiteral("org.bluez");
const QString ADAPTER_INTERFACE = QStringLiteral("org.bluez.Adapter1");
const QString DEVICE_INTERFACE = QStringLiteral("org.bluez.Device1");
const QString PROPERTIES_INTERFACE = QStringLiteral("org.freedesktop.DBus.Properties");
const QString OBJECT_MANAGER_INTERFACE = QStringLiteral("org.freedesktop.DBus.ObjectManager");

using InterfaceMap = QMap<QString, QVariantMap>;

// Reads an a{sa{sv}} (interface -> properties) block from the current
// position of arg.
InterfaceMap readInterfaces(const QDBusArgument& arg) {
    InterfaceMap interfaces;
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QString interfaceName;
        arg >> interfaceName;

        QVariantMap properties;
        arg.beginMap();
        while (!arg.atEnd()) {
            arg.beginMapEntry();
            QString key;
            QDBusVariant value;
            arg >> key >> value;
            properties.insert(key, value.variant());
            arg.endMapEntry();
        }
        arg.endMap();

        interfaces.insert(interfaceName, properties);
        arg.endMapEntry();
    }
    arg.endMap();
    return interfaces;
}

// Signal arguments arrive as QDBusArgument from the bus, or already
// demarshalled when the message was built locally.
InterfaceMap interfacesFrom(const QVariant& value) {
    if (value.userType() == qMetaTypeId<QDBusArgument>()) {
        return readInterfaces(value.value<QDBusArgument>());
    }
    return value.value<InterfaceMap>();
}

// Result of GetManagedObjects: a{oa{sa{sv}}}
std::map<QString, InterfaceMap> readManagedObjects(const QDBusArgument& arg) {
    std::map<QString, InterfaceMap> objects;
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QDBusObjectPath path;
        arg >> path;
        objects[path.path()] = readInterfaces(arg);
        arg.endMapEntry();
    }
    arg.endMap();
    return objects;
}

std::string displayName(const QVariantMap& properties, const DeviceAddress& address) {
    QString name = properties.value(QStringLiteral("Alias")).toString();
    if (name.isEmpty()) {
        name = properties.value(QStringLiteral("Name")).toString();
    }
    if (name.isEmpty()) {
        return address.toString();
    }
    return name.toStdString();
}

} // namespace

class BluezGateway::Private {
public:
    QDBusConnection bus{QDBusConnection::systemBus()};
    int callTimeout{DEFAULT_GATEWAY_TIMEOUT};
    bool signalsConnected{false};

    // Guards adapterPath and devicePaths; both are read from worker threads.
    mutable std::mutex pathMutex;
    QString adapterPath;
    std::map<DeviceAddress, QString> devicePaths;

    QString adapter() const {
        std::lock_guard<std::mutex> lock(pathMutex);
        return adapterPath;
    }

    void setAdapter(const QString& path) {
        std::lock_guard<std::mutex> lock(pathMutex);
        adapterPath = path;
    }

    QDBusMessage callManagedObjects() const {
        QDBusMessage call = QDBusMessage::createMethodCall(
            BLUEZ_SERVICE, QStringLiteral("/"), OBJECT_MANAGER_INTERFACE,
            QStringLiteral("GetManagedObjects"));
        return bus.call(call, QDBus::Block, callTimeout);
    }

    QString findAdapterPath() const {
        QDBusMessage reply = callManagedObjects();
        if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
            return {};
        }

        const QDBusArgument arg = reply.arguments().first().value<QDBusArgument>();
        for (const auto& [path, interfaces] : readManagedObjects(arg)) {
            if (interfaces.contains(ADAPTER_INTERFACE)) {
                return path;
            }
        }
        return {};
    }

    QVariant adapterProperty(const QString& property) const {
        QDBusMessage call = QDBusMessage::createMethodCall(
            BLUEZ_SERVICE, adapter(), PROPERTIES_INTERFACE, QStringLiteral("Get"));
        call << ADAPTER_INTERFACE << property;
        QDBusMessage reply = bus.call(call, QDBus::Block, callTimeout);
        if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
            LOG_WARNING("Failed to read adapter property " + property.toStdString() +
                        ": " + reply.errorMessage().toStdString());
            return {};
        }
        return reply.arguments().first().value<QDBusVariant>().variant();
    }
};

BluezGateway::BluezGateway(QObject* parent)
    : BluetoothGateway(parent)
    , d(std::make_unique<Private>()) {
}

BluezGateway::~BluezGateway() = default;

void BluezGateway::setCallTimeout(std::chrono::milliseconds timeout) {
    d->callTimeout = static_cast<int>(timeout.count());
}

void BluezGateway::initialize() {
    if (!d->bus.isConnected()) {
        throw BluetoothUnavailableError(
            "Cannot connect to the D-Bus system bus: " +
            d->bus.lastError().message().toStdString());
    }

    QDBusConnectionInterface* busInterface = d->bus.interface();
    if (!busInterface || !busInterface->isServiceRegistered(BLUEZ_SERVICE).value()) {
        throw BluetoothUnavailableError("The BlueZ service (org.bluez) is not running");
    }

    const QString adapterPath = d->findAdapterPath();
    if (adapterPath.isEmpty()) {
        throw BluetoothUnavailableError("No Bluetooth adapter found");
    }
    d->setAdapter(adapterPath);

    if (!d->adapterProperty(QStringLiteral("Powered")).toBool()) {
        LOG_WARNING("Bluetooth adapter " + adapterPath.toStdString() +
                    " is powered off; connections will fail until it is enabled");
    }

    LOG_INFO("Using Bluetooth adapter " + adapterPath.toStdString() + " (" +
             d->adapterProperty(QStringLiteral("Address")).toString().toStdString() + ")");

    if (d->signalsConnected) {
        return;
    }

    d->bus.connect(BLUEZ_SERVICE, QString(), PROPERTIES_INTERFACE,
                   QStringLiteral("PropertiesChanged"),
                   this, SLOT(onPropertiesChanged(QDBusMessage)));
    d->bus.connect(BLUEZ_SERVICE, QString(), OBJECT_MANAGER_INTERFACE,
                   QStringLiteral("InterfacesAdded"),
                   this, SLOT(onInterfacesAdded(QDBusMessage)));
    d->bus.connect(BLUEZ_SERVICE, QString(), OBJECT_MANAGER_INTERFACE,
                   QStringLiteral("InterfacesRemoved"),
                   this, SLOT(onInterfacesRemoved(QDBusMessage)));

    auto* watcher = new QDBusServiceWatcher(BLUEZ_SERVICE, d->bus,
        QDBusServiceWatcher::WatchForRegistration | QDBusServiceWatcher::WatchForUnregistration,
        this);
    connect(watcher, &QDBusServiceWatcher::serviceUnregistered, this, []() {
        LOG_ERROR("BlueZ left the system bus; device states are frozen until it returns");
    });
    connect(watcher, &QDBusServiceWatcher::serviceRegistered, this, [this]() {
        LOG_INFO("BlueZ restarted, re-reading adapter and devices");
        QString path = d->findAdapterPath();
        if (path.isEmpty()) {
            LOG_ERROR("No Bluetooth adapter found after BlueZ restart");
            return;
        }
        d->setAdapter(path);
        emit pairedDevicesInvalidated();
    });

    d->signalsConnected = true;
}

std::vector<Device> BluezGateway::listPairedDevices() {
    QDBusMessage reply = d->callManagedObjects();
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        throw std::runtime_error("GetManagedObjects failed: " +
                                 reply.errorMessage().toStdString());
    }

    std::vector<Device> devices;
    std::map<DeviceAddress, QString> paths;
    const Timestamp now = std::chrono::system_clock::now();

    const QDBusArgument arg = reply.arguments().first().value<QDBusArgument>();
    for (const auto& [path, interfaces] : readManagedObjects(arg)) {
        auto it = interfaces.find(DEVICE_INTERFACE);
        if (it == interfaces.end()) {
            continue;
        }

        const QVariantMap& properties = it.value();
        if (!properties.value(QStringLiteral("Paired")).toBool()) {
            continue;
        }

        auto address = DeviceAddress::fromString(
            properties.value(QStringLiteral("Address")).toString().toStdString());
        if (!address) {
            address = addressFromPath(path);
        }
        if (!address) {
            LOG_WARNING("Skipping device with unreadable address at " + path.toStdString());
            continue;
        }

        Device device;
        device.address = *address;
        device.name = displayName(properties, *address);
        device.state = properties.value(QStringLiteral("Connected")).toBool()
            ? ConnectionState::Connected
            : ConnectionState::Disconnected;
        device.revertState = device.state;
        device.lastObservedAt = now;

        devices.push_back(device);
        paths[*address] = path;
    }

    {
        std::lock_guard<std::mutex> lock(d->pathMutex);
        d->devicePaths = std::move(paths);
    }

    return devices;
}

GatewayResult BluezGateway::connectDevice(const DeviceAddress& address) {
    return callDevice(address, QStringLiteral("Connect"));
}

GatewayResult BluezGateway::disconnectDevice(const DeviceAddress& address) {
    return callDevice(address, QStringLiteral("Disconnect"));
}

GatewayResult BluezGateway::callDevice(const DeviceAddress& address, const QString& method) {
    QDBusMessage call = QDBusMessage::createMethodCall(
        BLUEZ_SERVICE, devicePath(address), DEVICE_INTERFACE, method);
    QDBusMessage reply = d->bus.call(call, QDBus::Block, d->callTimeout);

    if (reply.type() != QDBusMessage::ErrorMessage) {
        return GatewayResult::ok();
    }

    const QString errorName = reply.errorName();
    // The device already is where the user wanted it
    if ((method == QLatin1String("Connect") &&
         errorName == QLatin1String("org.bluez.Error.AlreadyConnected")) ||
        (method == QLatin1String("Disconnect") &&
         errorName == QLatin1String("org.bluez.Error.NotConnected"))) {
        return GatewayResult::ok();
    }

    LOG_DEBUG("Device1." + method.toStdString() + " on " + address.toString() +
              " returned " + errorName.toStdString() + ": " +
              reply.errorMessage().toStdString());
    return GatewayResult::failure(reasonFromError(errorName, reply.errorMessage()));
}

QString BluezGateway::devicePath(const DeviceAddress& address) const {
    {
        std::lock_guard<std::mutex> lock(d->pathMutex);
        auto it = d->devicePaths.find(address);
        if (it != d->devicePaths.end()) {
            return it->second;
        }
    }

    QString mac = QString::fromStdString(address.toString());
    mac.replace(QLatin1Char(':'), QLatin1Char('_'));
    return d->adapter() + QStringLiteral("/dev_") + mac;
}

std::optional<DeviceAddress> BluezGateway::addressFromPath(const QString& path) {
    QString leaf = path.section(QLatin1Char('/'), -1);
    if (!leaf.startsWith(QLatin1String("dev_"))) {
        return std::nullopt;
    }
    return DeviceAddress::fromString(leaf.mid(4).toStdString());
}

std::string BluezGateway::reasonFromError(const QString& errorName, const QString& errorMessage) {
    if (errorName == QLatin1String("org.freedesktop.DBus.Error.NoReply") ||
        errorName == QLatin1String("org.freedesktop.DBus.Error.Timeout") ||
        errorName == QLatin1String("org.freedesktop.DBus.Error.TimedOut")) {
        return "timeout";
    }
    if (errorName == QLatin1String("org.bluez.Error.InProgress")) {
        return "operation already in progress";
    }
    if (errorName == QLatin1String("org.bluez.Error.NotReady")) {
        return "adapter not ready";
    }
    if (errorName == QLatin1String("org.freedesktop.DBus.Error.UnknownObject")) {
        return "device not known to the adapter";
    }
    if (!errorMessage.isEmpty()) {
        return errorMessage.toStdString();
    }
    if (!errorName.isEmpty()) {
        return errorName.section(QLatin1Char('.'), -1).toStdString();
    }
    return "unknown error";
}

std::optional<Device> BluezGateway::readDevice(const QString& path) {
    QDBusMessage call = QDBusMessage::createMethodCall(
        BLUEZ_SERVICE, path, PROPERTIES_INTERFACE, QStringLiteral("GetAll"));
    call << DEVICE_INTERFACE;
    QDBusMessage reply = d->bus.call(call, QDBus::Block, d->callTimeout);
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        LOG_WARNING("Failed to read " + path.toStdString() + ": " +
                    reply.errorMessage().toStdString());
        return std::nullopt;
    }

    auto properties = qdbus_cast<QVariantMap>(reply.arguments().first());
    auto address = addressFromPath(path);
    if (!address) {
        return std::nullopt;
    }

    Device device;
    device.address = *address;
    device.name = displayName(properties, *address);
    device.state = properties.value(QStringLiteral("Connected")).toBool()
        ? ConnectionState::Connected
        : ConnectionState::Disconnected;
    device.revertState = device.state;
    device.lastObservedAt = std::chrono::system_clock::now();

    if (!properties.value(QStringLiteral("Paired")).toBool()) {
        return std::nullopt;
    }
    return device;
}

void BluezGateway::onPropertiesChanged(const QDBusMessage& message) {
    const QList<QVariant> args = message.arguments();
    if (args.size() < 2 || args.at(0).toString() != DEVICE_INTERFACE) {
        return;
    }

    auto address = addressFromPath(message.path());
    if (!address) {
        return;
    }

    const Timestamp observedAt = std::chrono::system_clock::now();
    const auto changed = qdbus_cast<QVariantMap>(args.at(1));

    if (changed.contains(QStringLiteral("Paired"))) {
        if (!changed.value(QStringLiteral("Paired")).toBool()) {
            emit deviceUnpaired(*address);
            return;
        }
        if (auto device = readDevice(message.path())) {
            {
                std::lock_guard<std::mutex> lock(d->pathMutex);
                d->devicePaths[*address] = message.path();
            }
            emit devicePaired(*device);
        }
        return;
    }

    if (changed.contains(QStringLiteral("Connected"))) {
        auto state = changed.value(QStringLiteral("Connected")).toBool()
            ? ConnectionState::Connected
            : ConnectionState::Disconnected;
        emit connectionStateChanged(*address, state, observedAt);
    }

    if (changed.contains(QStringLiteral("Alias")) || changed.contains(QStringLiteral("Name"))) {
        if (auto device = readDevice(message.path())) {
            emit devicePaired(*device);
        }
    }
}

void BluezGateway::onInterfacesAdded(const QDBusMessage& message) {
    const QList<QVariant> args = message.arguments();
    if (args.size() < 2) {
        return;
    }

    const QString path = args.at(0).value<QDBusObjectPath>().path();
    const InterfaceMap interfaces = interfacesFrom(args.at(1));
    auto it = interfaces.find(DEVICE_INTERFACE);
    if (it == interfaces.end() || !it.value().value(QStringLiteral("Paired")).toBool()) {
        return;
    }

    auto address = addressFromPath(path);
    if (!address) {
        return;
    }

    Device device;
    device.address = *address;
    device.name = displayName(it.value(), *address);
    device.state = it.value().value(QStringLiteral("Connected")).toBool()
        ? ConnectionState::Connected
        : ConnectionState::Disconnected;
    device.revertState = device.state;
    device.lastObservedAt = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(d->pathMutex);
        d->devicePaths[*address] = path;
    }
    emit devicePaired(device);
}

void BluezGateway::onInterfacesRemoved(const QDBusMessage& message) {
    const QList<QVariant> args = message.arguments();
    if (args.size() < 2) {
        return;
    }

    const QString path = args.at(0).value<QDBusObjectPath>().path();
    const QStringList interfaces = args.at(1).toStringList();
    if (!interfaces.contains(DEVICE_INTERFACE)) {
        return;
    }

    if (auto address = addressFromPath(path)) {
        {
            std::lock_guard<std::mutex> lock(d->pathMutex);
            d->devicePaths.erase(*address);
        }
        emit deviceUnpaired(*address);
    }
}

} // namespace bluetray
