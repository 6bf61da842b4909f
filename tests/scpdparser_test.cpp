/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "scpdparser.h"

#include <QByteArray>
#include <QString>
#include <catch2/catch_test_macros.hpp>

static const auto renderingScpd = QByteArrayLiteral(
    "<?xml version=\"1.0\"?>"
    "<scpd xmlns=\"urn:schemas-upnp-org:service-1-0\">"
    "<specVersion><major>1</major><minor>1</minor></specVersion>"
    "<actionList>"
    "<action><name>GetVolume</name><argumentList>"
    "<argument><name>InstanceID</name><direction>in</direction>"
    "<relatedStateVariable>A_ARG_TYPE_InstanceID</relatedStateVariable></argument>"
    "<argument><name>Channel</name><direction>IN</direction>"
    "<relatedStateVariable>A_ARG_TYPE_Channel</relatedStateVariable></argument>"
    "<argument><name>CurrentVolume</name><direction>out</direction>"
    "<relatedStateVariable>Volume</relatedStateVariable></argument>"
    "</argumentList></action>"
    "<action><name>SetVolume</name><argumentList>"
    "<argument><name>InstanceID</name><direction>in</direction>"
    "<relatedStateVariable>A_ARG_TYPE_InstanceID</relatedStateVariable></argument>"
    "<argument><name>Broken</name><direction>sideways</direction></argument>"
    "<argument><name>DesiredVolume</name><direction>in</direction>"
    "<relatedStateVariable>Volume</relatedStateVariable></argument>"
    "</argumentList></action>"
    "<action><argumentList/></action>"
    "<action><name>ListPresets</name></action>"
    "</actionList>"
    "<serviceStateTable>"
    "<stateVariable sendEvents=\"no\"><name>A_ARG_TYPE_InstanceID</name>"
    "<dataType>ui4</dataType></stateVariable>"
    "<stateVariable sendEvents=\"no\"><name>A_ARG_TYPE_Channel</name><dataType>string</dataType>"
    "<allowedValueList><allowedValue>Master</allowedValue><allowedValue>LF</allowedValue>"
    "</allowedValueList></stateVariable>"
    "<stateVariable><name>Volume</name><dataType>ui2</dataType>"
    "<allowedValueRange><minimum>0</minimum><maximum>100</maximum><step>1</step>"
    "</allowedValueRange></stateVariable>"
    "</serviceStateTable>"
    "</scpd>");

static const QString renderingType{"urn:schemas-upnp-org:service:RenderingControl:1"};

TEST_CASE("SCPD parsing", "[scpd]") {
    auto doc = scpd::parseScpd(renderingScpd, renderingType,
                               "http://192.168.1.50:1400/xml/RenderingControl1.xml");

    SECTION("document") {
        REQUIRE(doc.parsingSuccess);
        REQUIRE(doc.serviceType == renderingType);
        REQUIRE(doc.specVersionMajor == 1);
        REQUIRE(doc.specVersionMinor == 1);
        REQUIRE(doc.actionCount() == 3);
        REQUIRE(doc.stateVariables.size() == 3);
        REQUIRE(doc.actionsWithArguments().size() == 2);
    }

    SECTION("malformed parts are recorded and skipped") {
        REQUIRE(doc.parsingErrors.contains(QStringLiteral("Action without name skipped")));
        REQUIRE(doc.parsingErrors.contains(
                    QStringLiteral("Action SetVolume: argument Broken has invalid direction 'sideways'")));

        const auto &setVolume = doc.actions.value("SetVolume");
        REQUIRE(setVolume.argumentsIn.size() == 2);
        REQUIRE(setVolume.argumentsOut.empty());
    }

    SECTION("arguments") {
        const auto &getVolume = doc.actions.value("GetVolume");
        REQUIRE(getVolume.argumentsIn.size() == 2);
        REQUIRE(getVolume.argumentsIn[1].direction == QStringLiteral("in"));
        REQUIRE(getVolume.argumentsIn[1].allowedValues == QStringList{"Master", "LF"});
        REQUIRE(getVolume.argumentsOut.size() == 1);

        const auto &out = getVolume.argumentsOut.front();
        REQUIRE(out.dataType == QStringLiteral("ui2"));
        REQUIRE(out.minimum == QStringLiteral("0"));
        REQUIRE(out.maximum == QStringLiteral("100"));
    }

    SECTION("state variables") {
        REQUIRE(!doc.stateVariables.value("A_ARG_TYPE_InstanceID").sendEvents);
        REQUIRE(doc.stateVariables.value("Volume").sendEvents);
        REQUIRE(doc.stateVariables.value("Volume").step == QStringLiteral("1"));
    }

    SECTION("json") {
        auto json = doc.toJson();
        REQUIRE(json.value("parsingSuccess").toBool());
        REQUIRE(json.value("actions").toObject().size() == 3);
    }
}

TEST_CASE("SCPD failures", "[scpd]") {
    SECTION("unparseable document") {
        auto doc = scpd::parseScpd(QByteArrayLiteral("not xml at all"), renderingType);
        REQUIRE(!doc.parsingSuccess);
        REQUIRE(!doc.parsingErrors.isEmpty());
        REQUIRE(doc.actions.isEmpty());
    }

    SECTION("empty document") {
        auto doc = scpd::parseScpd(QByteArrayLiteral("<scpd></scpd>"), renderingType);
        REQUIRE(doc.parsingSuccess);
        REQUIRE(doc.actionCount() == 0);
    }
}

TEST_CASE("SCPD url joining", "[scpd]") {
    REQUIRE(scpd::joinUrl("http://host:1400/", "/xml/a.xml") == QStringLiteral("http://host:1400/xml/a.xml"));
    REQUIRE(scpd::joinUrl("http://host:1400", "xml/a.xml") == QStringLiteral("http://host:1400/xml/a.xml"));
    REQUIRE(scpd::joinUrl("http://host:1400", "http://other/a.xml") == QStringLiteral("http://other/a.xml"));
}
