/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef XMLTOOLS_H
#define XMLTOOLS_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>
#include <utility>
#include <vector>

class QDomElement;

/*
 * Owned element tree produced by the tolerant parser. Names are local names
 * (prefix removed) and every lookup ignores case, so <friendlyName>,
 * <FriendlyName> and gumbo's lowercased <friendlyname> are the same node.
 */
class XmlNode
{
public:
    QString name;
    QString text;
    std::vector<std::pair<QString, QString>> attributes;
    std::vector<XmlNode> children;

    bool isNull() const;
    bool is(const QString &tag) const;
    const XmlNode* child(const QString &tag) const;
    std::vector<const XmlNode*> childrenNamed(const QString &tag) const;
    // Depth-first search, the node itself included
    const XmlNode* find(const QString &tag) const;
    std::vector<const XmlNode*> findAll(const QString &tag) const;
    QString childText(const QString &tag, const QString &defaultValue = {}) const;
    // First tag from the list that exists as a child
    QString childText(const QStringList &tags, const QString &defaultValue = {}) const;
    QString attribute(const QString &attrName, const QString &defaultValue = {}) const;
    bool hasAttribute(const QString &attrName) const;
};

namespace xmltools
{
enum class ParseStage {
    Strict,
    EscapedEntities,
    Extracted,
    TagSoup
};

QString sanitize(const QByteArray &data);
QString stripNamespaces(const QString &xml);
QString escapeBareAmpersands(const QString &xml);
std::optional<QString> extractRootElement(const QString &xml);
std::optional<XmlNode> parseStrict(const QString &xml, QString *error = nullptr);
std::optional<XmlNode> parseTagSoup(const QByteArray &data);
std::optional<XmlNode> parseWithFallbacks(const QByteArray &data, QString *error = nullptr,
                                          ParseStage *stage = nullptr);
XmlNode fromDomElement(const QDomElement &element);
QString stageName(ParseStage stage);
}

#endif // XMLTOOLS_H
