/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "httpclient.h"
#include "mediacontroller.h"
#include "profilestore.h"
#include "soapclient.h"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <QTcpServer>
#include <QUrl>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <memory>

namespace {

// Records calls, fails every call for hosts in failingHosts. Calls for
// slowHosts go to silentUrl, which accepts the connection and never answers.
class FakeUpnpAdapter : public ProtocolAdapter
{
public:
    std::atomic<int> calls{0};
    QStringList failingHosts;
    QStringList slowHosts;
    QUrl silentUrl;
    int slowTimeout = 300;
    QStringList log;
    QMutex mutex;

    Protocol protocol() const override { return Protocol::UPnP; }

    ControlResult play(const ControlTarget &t) override { return handle("play", t); }
    ControlResult pause(const ControlTarget &t) override { return handle("pause", t); }
    ControlResult stop(const ControlTarget &t) override { return handle("stop", t); }

    ControlResult setUri(const ControlTarget &t, const QString &uri, const QString &) override
    {
        auto r = handle("set_uri", t);
        if (r.success())
            r.values.insert("uri", uri);
        return r;
    }

    ControlResult setVolume(const ControlTarget &t, int level) override
    {
        auto r = handle("set_volume", t);
        if (r.success())
            r.values.insert("volume", level);
        return r;
    }

private:
    ControlResult handle(const QString &action, const ControlTarget &t)
    {
        ++calls;
        {
            QMutexLocker locker{&mutex};
            log << action + '@' + t.host;
        }
        if (failingHosts.contains(t.host))
            return ControlResult::failed(action, Protocol::UPnP, ErrorType::Transport,
                                         "Connection refused");
        if (slowHosts.contains(t.host)) {
            HttpClient client;
            client.setTimeout(slowTimeout);
            auto reply = client.get(silentUrl);
            if (!reply.ok())
                return ControlResult::failed(action, Protocol::UPnP, ErrorType::Transport,
                                             reply.errorString);
        }
        return ControlResult::ok(action, Protocol::UPnP);
    }
};

Device makeDevice(const QString &ip, int port = 1400)
{
    Device d;
    d.ip = ip;
    d.port = port;
    return d;
}
}

TEST_CASE("Media controller volume validation", "[controller]") {
    auto fake = std::make_shared<FakeUpnpAdapter>();
    auto registry = std::make_shared<AdapterRegistry>();
    registry->registerAdapter(fake);
    MediaController controller{std::make_shared<ProfileStore>(), registry};
    auto device = makeDevice("10.0.0.1");

    SECTION("out of range levels never reach the adapter") {
        for (int level : {-1, 101, 1000}) {
            auto result = controller.setVolume(device, level);
            REQUIRE(result.isError());
            REQUIRE(result.errorType == ErrorType::Validation);
            REQUIRE(result.toVariantMap().value("error_type").toString() ==
                    QStringLiteral("validation_error"));
        }
        REQUIRE(fake->calls.load() == 0);
    }

    SECTION("boundaries are accepted") {
        REQUIRE(controller.setVolume(device, 0).success());
        REQUIRE(controller.setVolume(device, 100).success());
        REQUIRE(fake->calls.load() == 2);
    }

    SECTION("empty uri") {
        auto result = controller.setUri(device, "  ");
        REQUIRE(result.errorType == ErrorType::Validation);
        REQUIRE(fake->calls.load() == 0);
    }
}

TEST_CASE("Media controller dispatch", "[controller]") {
    auto fake = std::make_shared<FakeUpnpAdapter>();
    auto registry = AdapterRegistry::make_default(std::make_shared<SoapClient>(1000), 1000);
    registry->registerAdapter(fake);

    auto profiles = std::make_shared<ProfileStore>();
    profiles->setProfiles({*DeviceProfile::fromJson(QJsonObject{
        {"name", "Google Chromecast"},
        {"match", QJsonObject{{"manufacturer", QJsonArray{"Google"}}}},
        {"cast", QJsonObject{{"port", 8008}}}
    })});

    MediaController controller{profiles, registry};

    SECTION("unmatched device uses generic upnp") {
        auto device = makeDevice("10.0.0.1", 0);
        auto t = controller.target(device);
        REQUIRE(t.info.profileName == QStringLiteral("Generic UPnP"));
        REQUIRE(t.port == 1400);

        REQUIRE(controller.play(device).success());
        REQUIRE(fake->log == QStringList{"play@10.0.0.1"});
    }

    SECTION("not supported is a normal outcome") {
        auto result = controller.next(makeDevice("10.0.0.1"));
        REQUIRE(result.status == ControlResult::Status::NotSupported);
        REQUIRE(!result.isError());
        REQUIRE(result.toVariantMap().value("status").toString() == QStringLiteral("not_supported"));
        REQUIRE(fake->calls.load() == 0);
    }

    SECTION("vendor without implementation") {
        auto device = makeDevice("10.0.0.9", 8008);
        device.manufacturer = "Google Inc.";

        auto result = controller.play(device);
        REQUIRE(result.status == ControlResult::Status::NotImplemented);
        REQUIRE(result.protocol == Protocol::Cast);
        REQUIRE(fake->calls.load() == 0);
    }
}

TEST_CASE("Media controller mass operations", "[controller]") {
    auto fake = std::make_shared<FakeUpnpAdapter>();
    fake->failingHosts << "10.0.0.2";
    auto registry = std::make_shared<AdapterRegistry>();
    registry->registerAdapter(fake);
    MediaController controller{std::make_shared<ProfileStore>(), registry};

    SECTION("one failing device does not stop the others") {
        std::vector<Device> devices{makeDevice("10.0.0.1"), makeDevice("10.0.0.2"),
                                    makeDevice("10.0.0.3")};

        auto results = controller.massOperation(devices, [](MediaController &c, const Device &d) {
            return c.stop(d);
        });

        REQUIRE(results.size() == 3);
        REQUIRE(results.value("10.0.0.1:1400").success());
        REQUIRE(results.value("10.0.0.2:1400").errorType == ErrorType::Transport);
        REQUIRE(results.value("10.0.0.3:1400").success());
        REQUIRE(fake->calls.load() == 3);
    }

    SECTION("play sequence runs in order") {
        auto results = controller.playSequence(makeDevice("10.0.0.1"), "http://h/a.mp3", 30);
        REQUIRE(results.size() == 4);
        REQUIRE(fake->log == QStringList{"stop@10.0.0.1", "set_volume@10.0.0.1",
                                         "set_uri@10.0.0.1", "play@10.0.0.1"});
        REQUIRE(results[2].values.value("uri").toString() == QStringLiteral("http://h/a.mp3"));
    }

    SECTION("play sequence stops at the first error") {
        auto results = controller.playSequence(makeDevice("10.0.0.2"), "http://h/a.mp3", 30);
        REQUIRE(results.size() == 1);
        REQUIRE(results.front().isError());
        REQUIRE(fake->calls.load() == 1);
    }

    SECTION("invalid volume aborts the sequence") {
        auto results = controller.playSequence(makeDevice("10.0.0.1"), "http://h/a.mp3", 150);
        REQUIRE(results.size() == 2);
        REQUIRE(results.back().errorType == ErrorType::Validation);
        REQUIRE(fake->log == QStringList{"stop@10.0.0.1"});
    }
}

TEST_CASE("Media controller mass operation with unresponsive devices", "[controller]") {
    // Connections are queued by the kernel, nothing ever reads or answers them
    QTcpServer silent;
    REQUIRE(silent.listen(QHostAddress::LocalHost));

    auto fake = std::make_shared<FakeUpnpAdapter>();
    fake->silentUrl = QUrl{QStringLiteral("http://127.0.0.1:%1/ctl").arg(silent.serverPort())};
    fake->slowTimeout = 500;
    fake->slowHosts << "10.0.1.1" << "10.0.1.2" << "10.0.1.3" << "10.0.1.4";
    auto registry = std::make_shared<AdapterRegistry>();
    registry->registerAdapter(fake);
    MediaController controller{std::make_shared<ProfileStore>(), registry};

    const QStringList fastHosts{"10.0.0.1", "10.0.0.3", "10.0.0.5"};

    std::vector<Device> devices;
    for (const auto &host : fake->slowHosts)
        devices.push_back(makeDevice(host));
    for (const auto &host : fastHosts)
        devices.push_back(makeDevice(host));

    QElapsedTimer timer;
    timer.start();
    auto results = controller.massOperation(devices, [](MediaController &c, const Device &d) {
        return c.stop(d);
    });

    // Four timeouts of 500 ms run side by side
    REQUIRE(timer.elapsed() < 1800);
    REQUIRE(results.size() == 7);
    REQUIRE(fake->calls.load() == 7);

    for (const auto &host : fake->slowHosts) {
        const auto result = results.value(host + ":1400");
        REQUIRE(result.isError());
        REQUIRE(result.errorType == ErrorType::Transport);
        REQUIRE(result.action == QStringLiteral("stop"));
        REQUIRE(result.error.contains("Timeout"));
    }
    for (const auto &host : fastHosts) {
        const auto result = results.value(host + ":1400");
        REQUIRE(result.success());
        REQUIRE(result.action == QStringLiteral("stop"));
    }
}
